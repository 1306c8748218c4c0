// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <complex>
#include <qpe/data/qubit_operator.hpp>
#include <unordered_set>

#include "ut_common.hpp"

using namespace qpe::data;
using namespace std::complex_literals;

TEST(PauliStringTest, LabelIsBigEndian) {
  auto p = PauliString::from_label("XIZ");
  EXPECT_EQ(p.num_qubits(), 3u);
  EXPECT_EQ(p.get_pauli(0), 'Z');
  EXPECT_EQ(p.get_pauli(1), 'I');
  EXPECT_EQ(p.get_pauli(2), 'X');
  EXPECT_EQ(p.to_label(), "XIZ");
  EXPECT_EQ(p.weight(), 2u);
  EXPECT_FALSE(p.is_identity());
  EXPECT_TRUE(PauliString::from_label("II").is_identity());
}

TEST(PauliStringTest, InvalidInput) {
  EXPECT_THROW(PauliString::from_label("XA"), std::invalid_argument);
  EXPECT_THROW(PauliString({1, 0}, {1}), std::invalid_argument);
  EXPECT_THROW(PauliString::from_label("X").get_pauli(1), std::out_of_range);
}

TEST(PauliStringTest, SingleQubitMatrices) {
  Eigen::Matrix2cd x, y, z;
  x << 0, 1, 1, 0;
  y << 0, -1i, 1i, 0;
  z << 1, 0, 0, -1;
  EXPECT_TRUE(PauliString::from_label("X").to_matrix().isApprox(x));
  EXPECT_TRUE(PauliString::from_label("Y").to_matrix().isApprox(y));
  EXPECT_TRUE(PauliString::from_label("Z").to_matrix().isApprox(z));
  EXPECT_TRUE(PauliString::from_label("I").to_matrix().isApprox(
      Eigen::Matrix2cd::Identity()));
}

TEST(PauliStringTest, TensorOrderFollowsLabel) {
  // "ZX" = Z on qubit 1 (high bit) and X on qubit 0 (low bit)
  Eigen::Matrix2cd x, z;
  x << 0, 1, 1, 0;
  z << 1, 0, 0, -1;
  Eigen::MatrixXcd expected(4, 4);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) {
      expected(r, c) = z(r >> 1, c >> 1) * x(r & 1, c & 1);
    }
  }
  EXPECT_TRUE(PauliString::from_label("ZX").to_matrix().isApprox(expected));
}

TEST(PauliStringTest, HashAndEquality) {
  std::unordered_set<PauliString> set;
  set.insert(PauliString::from_label("XY"));
  set.insert(PauliString::from_label("XY"));
  set.insert(PauliString::from_label("YX"));
  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(PauliString::from_label("ZI"), PauliString({0, 1}, {0, 0}));
  EXPECT_NE(PauliString::from_label("ZI"), PauliString::from_label("IZ"));
}

TEST(QubitOperatorTest, FromLabels) {
  auto op = QubitOperator::from_labels({{0.5, "II"}, {-0.25, "ZX"}});
  EXPECT_EQ(op->num_qubits(), 2u);
  EXPECT_EQ(op->num_terms(), 2u);
  EXPECT_DOUBLE_EQ(op->one_norm(), 0.75);
  EXPECT_EQ(op->get_terms()[1].second.to_label(), "ZX");

  EXPECT_THROW(QubitOperator::from_labels({}), std::invalid_argument);
  EXPECT_THROW(QubitOperator::from_labels({{1.0, "X"}, {1.0, "XX"}}),
               std::invalid_argument);
}

TEST(QubitOperatorTest, SimplifyMergesAndDrops) {
  auto op = QubitOperator::from_labels(
      {{0.5, "Z"}, {0.25, "X"}, {0.5, "Z"}, {0.25, "I"}, {-0.25, "X"}});
  auto merged = op->simplify();
  ASSERT_EQ(merged.num_terms(), 2u);
  EXPECT_EQ(merged.get_terms()[0].second.to_label(), "Z");
  EXPECT_NEAR(merged.get_terms()[0].first.real(), 1.0,
              testing::numerical_zero_tolerance);
  EXPECT_EQ(merged.get_terms()[1].second.to_label(), "I");

  auto trimmed = op->simplify(0.5);
  ASSERT_EQ(trimmed.num_terms(), 1u);
}

TEST(QubitOperatorTest, HermiticityAndAdjoint) {
  auto hermitian = QubitOperator::from_labels({{0.5, "XZ"}, {1.0, "YY"}});
  EXPECT_TRUE(hermitian->is_hermitian());

  auto complex_op = QubitOperator::from_labels({{0.5i, "X"}});
  EXPECT_FALSE(complex_op->is_hermitian());
  auto adjoint = complex_op->adjoint();
  EXPECT_NEAR(adjoint.get_terms()[0].first.imag(), -0.5,
              testing::numerical_zero_tolerance);
  EXPECT_TRUE(adjoint.to_matrix().isApprox(complex_op->to_matrix().adjoint()));
}

TEST(QubitOperatorTest, FromMatrixDecomposesAndReconstructs) {
  auto reference = QubitOperator::from_labels(
      {{0.3, "II"}, {-0.7, "XZ"}, {0.2, "YY"}, {1.1, "IZ"}});
  const Eigen::MatrixXcd dense = reference->to_matrix();

  auto decomposed = QubitOperator::from_matrix(dense);
  EXPECT_EQ(decomposed->num_qubits(), 2u);
  EXPECT_EQ(decomposed->num_terms(), 4u);
  EXPECT_NEAR(decomposed->one_norm(), 2.3, testing::numerical_zero_tolerance);
  EXPECT_TRUE(decomposed->to_matrix().isApprox(dense));

  // Terms come out in label order with I < X < Y < Z
  EXPECT_EQ(decomposed->get_terms()[0].second.to_label(), "II");
  EXPECT_EQ(decomposed->get_terms()[1].second.to_label(), "IZ");
  EXPECT_EQ(decomposed->get_terms()[2].second.to_label(), "XZ");
  EXPECT_EQ(decomposed->get_terms()[3].second.to_label(), "YY");
}

TEST(QubitOperatorTest, FromMatrixRejectsBadShapes) {
  EXPECT_THROW(QubitOperator::from_matrix(Eigen::MatrixXcd::Zero(2, 3)),
               std::invalid_argument);
  EXPECT_THROW(QubitOperator::from_matrix(Eigen::MatrixXcd::Zero(3, 3)),
               std::invalid_argument);
}

TEST(QubitOperatorTest, Summary) {
  auto op = QubitOperator::from_labels({{0.5, "XI"}, {-0.25, "ZY"}});
  const auto summary = op->get_summary();
  EXPECT_NE(summary.find("2 qubits"), std::string::npos);
  EXPECT_NE(summary.find("ZY"), std::string::npos);
}
