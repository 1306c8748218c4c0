// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <numbers>
#include <qpe/data/circuit.hpp>

#include "ut_common.hpp"

using namespace qpe::data;
using namespace std::complex_literals;

TEST(QuantumRegisterTest, Qubits) {
  QuantumRegister reg("q", 3);
  EXPECT_EQ(reg.name(), "q");
  EXPECT_EQ(reg.size(), 3u);
  EXPECT_EQ(reg[2], (Qubit{"q", 2}));
  EXPECT_THROW(reg[3], std::out_of_range);
  auto qubits = reg.qubits();
  ASSERT_EQ(qubits.size(), 3u);
  EXPECT_EQ(qubits[0].index, 0u);
  EXPECT_EQ(qubits[0].register_name, "q");
}

TEST(CircuitTest, RegistersAreLaidOutInInsertionOrder) {
  QuantumRegister a("a", 2), q("q", 3);
  Circuit circuit({a, q});
  EXPECT_EQ(circuit.num_qubits(), 5u);
  EXPECT_EQ(circuit.global_index(a[1]), 1u);
  EXPECT_EQ(circuit.global_index(q[0]), 2u);
  EXPECT_EQ(circuit.global_index(q[2]), 4u);
  EXPECT_TRUE(circuit.has_register("q"));
  EXPECT_FALSE(circuit.has_register("b"));

  EXPECT_THROW(circuit.add_register(QuantumRegister("q", 1)),
               std::invalid_argument);
  EXPECT_THROW(circuit.global_index(Qubit{"b", 0}), std::invalid_argument);
  EXPECT_THROW(circuit.global_index(Qubit{"q", 3}), std::out_of_range);
}

TEST(CircuitTest, GateRecording) {
  QuantumRegister q("q", 2);
  Circuit circuit({q});
  circuit.h(q[0]);
  circuit.cu1(0.5, q[0], q[1]);
  circuit.cx(q[1], q[0]);
  circuit.crz(0.25, q[0], q[1]);

  ASSERT_EQ(circuit.num_gates(), 4u);
  const auto& gates = circuit.get_gates();
  EXPECT_EQ(gates[1].type, GateType::CU1);
  EXPECT_EQ(gates[1].qubits, (std::vector<std::size_t>{0, 1}));
  EXPECT_DOUBLE_EQ(gates[1].angle, 0.5);
  EXPECT_EQ(gates[2].qubits, (std::vector<std::size_t>{1, 0}));
  EXPECT_EQ(circuit.count_gates(GateType::H), 1u);
  EXPECT_EQ(circuit.count_gates(GateType::U1), 0u);

  EXPECT_THROW(circuit.cx(q[0], q[0]), std::invalid_argument);
  EXPECT_THROW(circuit.h(Qubit{"r", 0}), std::invalid_argument);
}

TEST(CircuitTest, GateTypeNames) {
  EXPECT_EQ(gate_type_to_string(GateType::CU1), "cu1");
  EXPECT_EQ(gate_type_to_string(GateType::CRZ), "crz");
}

TEST(CircuitTest, SingleQubitMatrices) {
  QuantumRegister q("q", 1);
  Circuit h_circuit({q});
  h_circuit.h(q[0]);
  Eigen::Matrix2cd h;
  h << 1, 1, 1, -1;
  h /= std::sqrt(2.0);
  EXPECT_TRUE(h_circuit.to_matrix().isApprox(h, testing::unitary_tolerance));

  Circuit rz_circuit({q});
  rz_circuit.rz(0.6, q[0]);
  Eigen::Matrix2cd rz = Eigen::Matrix2cd::Zero();
  rz(0, 0) = std::exp(-0.3i);
  rz(1, 1) = std::exp(0.3i);
  EXPECT_TRUE(rz_circuit.to_matrix().isApprox(rz, testing::unitary_tolerance));

  Circuit rx_circuit({q});
  rx_circuit.rx(std::numbers::pi, q[0]);
  Eigen::Matrix2cd rx;
  rx << 0, -1i, -1i, 0;
  EXPECT_TRUE(rx_circuit.to_matrix().isApprox(rx, testing::unitary_tolerance));
}

TEST(CircuitTest, ControlledGatesUseLittleEndianIndices) {
  // Control on qubit 0 (low bit), target on qubit 1
  QuantumRegister q("q", 2);
  Circuit circuit({q});
  circuit.cx(q[0], q[1]);
  Eigen::MatrixXcd expected = Eigen::MatrixXcd::Zero(4, 4);
  expected(0, 0) = 1.0;
  expected(3, 1) = 1.0;
  expected(2, 2) = 1.0;
  expected(1, 3) = 1.0;
  EXPECT_TRUE(circuit.to_matrix().isApprox(expected));

  Circuit phase({q});
  phase.cu1(0.4, q[1], q[0]);
  Eigen::MatrixXcd diag = Eigen::MatrixXcd::Identity(4, 4);
  diag(3, 3) = std::exp(0.4i);
  EXPECT_TRUE(phase.to_matrix().isApprox(diag));
}

TEST(CircuitTest, BasisDecompositionOfControlledRz) {
  QuantumRegister q("q", 2);
  Circuit native({q});
  native.crz(0.7, q[0], q[1]);

  Circuit decomposed({q});
  decomposed.rz(0.35, q[1]);
  decomposed.cx(q[0], q[1]);
  decomposed.rz(-0.35, q[1]);
  decomposed.cx(q[0], q[1]);

  EXPECT_TRUE(native.to_matrix().isApprox(decomposed.to_matrix(),
                                          testing::unitary_tolerance));
}

TEST(CircuitTest, GatesApplyInOrder) {
  QuantumRegister q("q", 1);
  Circuit circuit({q});
  circuit.x(q[0]);
  circuit.h(q[0]);
  // H X |0> = H |1> = (|0> - |1>) / sqrt(2)
  auto unitary = circuit.to_matrix();
  EXPECT_NEAR(unitary(0, 0).real(), 1.0 / std::sqrt(2.0),
              testing::unitary_tolerance);
  EXPECT_NEAR(unitary(1, 0).real(), -1.0 / std::sqrt(2.0),
              testing::unitary_tolerance);
}

TEST(CircuitTest, DenseEvaluationIsLimited) {
  Circuit circuit({QuantumRegister("q", 15)});
  EXPECT_THROW(circuit.to_matrix(), std::length_error);
}

TEST(CircuitTest, JsonDescription) {
  QuantumRegister a("a", 2), q("q", 1);
  Circuit circuit({a, q});
  circuit.h(a[0]);
  circuit.u1(0.125, a[1]);
  circuit.cu1(-0.5, a[1], a[0]);
  circuit.crz(1.5, a[0], q[0]);

  auto json = circuit.to_json();
  ASSERT_EQ(json["registers"].size(), 2u);
  EXPECT_EQ(json["registers"][1]["name"], "q");
  ASSERT_EQ(json["gates"].size(), 4u);
  EXPECT_EQ(json["gates"][2]["gate"], "cu1");
  EXPECT_EQ(json["gates"][2]["qubits"].get<std::vector<std::size_t>>(),
            (std::vector<std::size_t>{1, 0}));
  EXPECT_EQ(json["gates"][3]["qubits"].get<std::vector<std::size_t>>(),
            (std::vector<std::size_t>{0, 2}));
  EXPECT_DOUBLE_EQ(json["gates"][1]["angle"].get<double>(), 0.125);
}
