// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <numbers>
#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/errors.hpp>
#include <variant>

#include "qpe/algorithms/native/approximate_fourier_transform.hpp"
#include "ut_common.hpp"

using namespace qpe::algorithms;
using namespace qpe::data;

namespace {

std::shared_ptr<Circuit> build(const FourierTransform& transform) {
  return std::get<std::shared_ptr<Circuit>>(
      transform.construct_circuit("circuit"));
}

}  // namespace

TEST(FourierTransformTest, Identification) {
  auto iqft = make_approximate_fourier_transform(3, 1);
  EXPECT_EQ(iqft->name(), "approximate");
  EXPECT_EQ(iqft->type_name(), "fourier_transform");
  EXPECT_EQ(iqft->num_qubits(), 3u);
  EXPECT_TRUE(iqft->is_inverse());
  EXPECT_FALSE(make_approximate_fourier_transform(3, 1, false)->is_inverse());
}

TEST(FourierTransformTest, SettingsAreLockedAtConstruction) {
  auto iqft = make_approximate_fourier_transform(4, 2);
  EXPECT_TRUE(iqft->settings().is_locked());
  EXPECT_EQ(iqft->settings().get<int64_t>("num_qubits"), 4);
  EXPECT_EQ(iqft->settings().get<int64_t>("degree"), 2);
  EXPECT_TRUE(iqft->settings().get<bool>("inverse"));
  EXPECT_THROW(iqft->settings().set("degree", 3),
               qpe::data::SettingsAreLocked);
  EXPECT_THROW(make_approximate_fourier_transform(0, 0),
               std::invalid_argument);
}

TEST(FourierTransformTest, VectorModeIsNormalizedDft) {
  auto iqft = make_approximate_fourier_transform(3, 2);
  auto result = iqft->construct_circuit("vector");
  ASSERT_TRUE(std::holds_alternative<Eigen::MatrixXcd>(result));
  const auto& matrix = std::get<Eigen::MatrixXcd>(result);
  ASSERT_EQ(matrix.rows(), 8);
  EXPECT_TRUE((matrix * matrix.adjoint())
                  .isApprox(Eigen::MatrixXcd::Identity(8, 8),
                            testing::unitary_tolerance));
  EXPECT_NEAR(std::abs(matrix(3, 5)), 1.0 / std::sqrt(8.0),
              testing::unitary_tolerance);
  EXPECT_TRUE(matrix.isApprox(testing::dft_matrix(3, -1),
                              testing::unitary_tolerance));

  auto qft = make_approximate_fourier_transform(3, 2, false);
  EXPECT_TRUE(qft->matrix().isApprox(matrix.adjoint(),
                                     testing::unitary_tolerance));
}

TEST(FourierTransformTest, UnknownModeIsRejected) {
  auto iqft = make_approximate_fourier_transform(2, 1);
  EXPECT_THROW(iqft->construct_circuit("matrix"), qpe::ConfigurationError);
}

TEST(FourierTransformTest, ExactInverseCircuitIsReversedDft) {
  for (std::size_t n = 1; n <= 4; ++n) {
    auto iqft = make_approximate_fourier_transform(n, n);
    auto circuit = build(*iqft);
    const Eigen::MatrixXcd expected =
        testing::bit_reversal_matrix(n) * testing::dft_matrix(n, -1);
    EXPECT_TRUE(circuit->to_matrix().isApprox(expected,
                                              testing::unitary_tolerance))
        << "n = " << n;
  }
}

TEST(FourierTransformTest, ForwardCircuitIsAdjointOfInverse) {
  for (std::size_t degree = 0; degree <= 3; ++degree) {
    auto forward = build(*make_approximate_fourier_transform(4, degree, false));
    auto inverse = build(*make_approximate_fourier_transform(4, degree, true));
    EXPECT_TRUE(forward->to_matrix().isApprox(
        inverse->to_matrix().adjoint(), testing::unitary_tolerance))
        << "degree = " << degree;
    EXPECT_EQ(forward->num_gates(), inverse->num_gates());
  }
}

TEST(FourierTransformTest, DegreeZeroKeepsOnlyHadamards) {
  auto circuit = build(*make_approximate_fourier_transform(4, 0));
  EXPECT_EQ(circuit->num_gates(), 4u);
  EXPECT_EQ(circuit->count_gates(GateType::H), 4u);
  EXPECT_EQ(circuit->count_gates(GateType::CU1), 0u);
}

TEST(FourierTransformTest, GateCountFollowsDegree) {
  const std::size_t n = 5;
  EXPECT_EQ(build(*make_approximate_fourier_transform(n, n - 1))
                ->count_gates(GateType::CU1),
            n * (n - 1) / 2);
  // Degree 2 drops the interactions at distance 3 and 4
  EXPECT_EQ(build(*make_approximate_fourier_transform(n, 2))
                ->count_gates(GateType::CU1),
            4u + 3u);
  EXPECT_EQ(build(*make_approximate_fourier_transform(n, 1))
                ->count_gates(GateType::CU1),
            4u);
}

TEST(FourierTransformTest, InverseGateOrderAndAngles) {
  auto circuit = build(*make_approximate_fourier_transform(3, 2));
  const auto& gates = circuit->get_gates();
  ASSERT_EQ(gates.size(), 6u);
  // j = 2: H(2), cu1(-pi/2, 2, 1), cu1(-pi/4, 2, 0)
  EXPECT_EQ(gates[0].type, GateType::H);
  EXPECT_EQ(gates[0].qubits, std::vector<std::size_t>{2});
  EXPECT_EQ(gates[1].qubits, (std::vector<std::size_t>{2, 1}));
  EXPECT_NEAR(gates[1].angle, -std::numbers::pi / 2.0,
              testing::numerical_zero_tolerance);
  EXPECT_EQ(gates[2].qubits, (std::vector<std::size_t>{2, 0}));
  EXPECT_NEAR(gates[2].angle, -std::numbers::pi / 4.0,
              testing::numerical_zero_tolerance);
  // j = 1: H(1), cu1(-pi/2, 1, 0); j = 0: H(0)
  EXPECT_EQ(gates[3].type, GateType::H);
  EXPECT_EQ(gates[4].qubits, (std::vector<std::size_t>{1, 0}));
  EXPECT_EQ(gates[5].qubits, std::vector<std::size_t>{0});
}

TEST(FourierTransformTest, AppendsToExistingCircuit) {
  QuantumRegister a("a", 2), q("q", 3);
  auto circuit = std::make_shared<Circuit>(std::vector<QuantumRegister>{a, q});
  auto iqft = make_approximate_fourier_transform(3, 2);
  auto result = iqft->run(circuit, q.qubits());
  EXPECT_EQ(result, circuit);
  EXPECT_EQ(circuit->num_gates(), 6u);
  EXPECT_EQ(circuit->get_gates()[0].qubits, std::vector<std::size_t>{4});

  EXPECT_THROW(iqft->append(*circuit, a.qubits()), std::invalid_argument);
}

TEST(FourierTransformTest, BuildsRegistersForBareQubits) {
  auto iqft = make_approximate_fourier_transform(2, 1);
  auto circuit = std::get<std::shared_ptr<Circuit>>(
      iqft->construct_circuit("circuit", {Qubit{"c", 0}, Qubit{"c", 1}}));
  ASSERT_EQ(circuit->get_registers().size(), 1u);
  EXPECT_EQ(circuit->get_registers()[0], QuantumRegister("c", 2));

  auto fresh = build(*iqft);
  EXPECT_TRUE(fresh->has_register("q"));
  EXPECT_EQ(fresh->num_qubits(), 2u);
}

TEST(FourierTransformTest, ProviderClampsDegree) {
  auto provider = make_approximate_fourier_transform_provider(10);
  auto transform = provider(3, false);
  EXPECT_FALSE(transform->is_inverse());
  auto approximate =
      std::dynamic_pointer_cast<const native::ApproximateFourierTransform>(
          transform);
  ASSERT_NE(approximate, nullptr);
  EXPECT_EQ(approximate->degree(), 3u);
  EXPECT_EQ(build(*transform)->count_gates(GateType::CU1), 3u);
}
