// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <memory>
#include <numbers>
#include <qpe/data/circuit_build_result.hpp>

#include "ut_common.hpp"

using namespace qpe::data;

namespace {

std::shared_ptr<Circuit> make_circuit(std::size_t num_ancillae,
                                      std::size_t num_state) {
  auto circuit = std::make_shared<Circuit>(std::vector<QuantumRegister>{
      QuantumRegister("a", num_ancillae), QuantumRegister("q", num_state)});
  circuit->h(Qubit{"a", 0});
  return circuit;
}

}  // namespace

TEST(CircuitBuildResultTest, Accessors) {
  CircuitBuildResult result(make_circuit(3, 1), QuantumRegister("q", 1),
                            QuantumRegister("a", 3), 1.5, 0.25, false);
  EXPECT_EQ(result.get_circuit()->num_qubits(), 4u);
  EXPECT_EQ(result.get_input_register().name(), "q");
  EXPECT_EQ(result.get_ancilla_register().size(), 3u);
  EXPECT_DOUBLE_EQ(result.get_scaling(), 1.5);
  ASSERT_TRUE(result.get_ancilla_phase_coefficient().has_value());
  EXPECT_DOUBLE_EQ(*result.get_ancilla_phase_coefficient(), 0.25);
  EXPECT_FALSE(result.has_negative_evals());
}

TEST(CircuitBuildResultTest, RejectsInconsistentInput) {
  EXPECT_THROW(CircuitBuildResult(nullptr, QuantumRegister("q", 1),
                                  QuantumRegister("a", 1), 1.0, std::nullopt,
                                  false),
               std::invalid_argument);
  EXPECT_THROW(CircuitBuildResult(make_circuit(1, 1), QuantumRegister("s", 1),
                                  QuantumRegister("a", 1), 1.0, std::nullopt,
                                  false),
               std::invalid_argument);
}

TEST(CircuitBuildResultTest, DecodePositivePhases) {
  // t = 7 pi / 4 with three ancillae: outcome 7 (y = 7) decodes to 1.0
  CircuitBuildResult result(make_circuit(3, 1), QuantumRegister("q", 1),
                            QuantumRegister("a", 3),
                            7.0 * std::numbers::pi / 4.0, std::nullopt, false);
  EXPECT_NEAR(result.decode_eigenvalue(7), 1.0, testing::eigenvalue_tolerance);
  EXPECT_NEAR(result.decode_eigenvalue(0), 0.0, testing::eigenvalue_tolerance);
  // Ancilla qubit 0 is the most significant phase bit: y = 4
  EXPECT_NEAR(result.decode_eigenvalue(1), 4.0 / 7.0,
              testing::eigenvalue_tolerance);
  EXPECT_THROW(result.decode_eigenvalue(8), std::out_of_range);
}

TEST(CircuitBuildResultTest, DecodeSignMagnitude) {
  CircuitBuildResult result(make_circuit(4, 1), QuantumRegister("q", 1),
                            QuantumRegister("a", 4),
                            7.0 * std::numbers::pi / 4.0, std::nullopt, true);
  EXPECT_NEAR(result.decode_eigenvalue(14), 0.5,
              testing::eigenvalue_tolerance);
  EXPECT_NEAR(result.decode_eigenvalue(15), -0.5,
              testing::eigenvalue_tolerance);
  // Qubit 1 alone carries the highest magnitude bit: w = 4
  EXPECT_NEAR(result.decode_eigenvalue(2), 2.0 / 7.0,
              testing::eigenvalue_tolerance);
}

TEST(CircuitBuildResultTest, JsonRecord) {
  CircuitBuildResult result(make_circuit(2, 2), QuantumRegister("q", 2),
                            QuantumRegister("a", 2), 0.75, -0.5, true);
  auto json = result.to_json();
  EXPECT_EQ(json["ancilla_register"]["name"], "a");
  EXPECT_EQ(json["input_register"]["size"], 2);
  EXPECT_DOUBLE_EQ(json["scaling"].get<double>(), 0.75);
  EXPECT_DOUBLE_EQ(json["ancilla_phase_coefficient"].get<double>(), -0.5);
  EXPECT_TRUE(json["negative_evals"].get<bool>());
  EXPECT_EQ(json["circuit"]["gates"].size(), 1u);

  CircuitBuildResult plain(make_circuit(1, 1), QuantumRegister("q", 1),
                           QuantumRegister("a", 1), 2.0, std::nullopt, false);
  EXPECT_FALSE(plain.to_json().contains("ancilla_phase_coefficient"));
}
