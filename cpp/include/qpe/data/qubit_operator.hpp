// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <complex>
#include <cstdint>
#include <memory>
#include <qpe/utils/hash.hpp>
#include <string>
#include <utility>
#include <vector>

namespace qpe::data {

/**
 * @brief A dense Pauli string over a fixed number of qubits
 *
 * Each qubit carries a (z, x) bit pair:
 * - (0, 0): Identity (I)
 * - (0, 1): Pauli X
 * - (1, 1): Pauli Y
 * - (1, 0): Pauli Z
 *
 * Labels are written big-endian: the first character of a label acts on the
 * highest qubit index. For example "XZ" is X on qubit 1 and Z on qubit 0.
 */
class PauliString {
 public:
  /**
   * @brief Construct the identity string on @p num_qubits qubits
   */
  explicit PauliString(std::size_t num_qubits = 0);

  /**
   * @brief Construct from explicit bit vectors
   * @param z Z bits, indexed by qubit
   * @param x X bits, indexed by qubit
   * @throws std::invalid_argument if the vectors differ in length
   */
  PauliString(std::vector<std::uint8_t> z, std::vector<std::uint8_t> x);

  /**
   * @brief Parse a big-endian label made of the characters I, X, Y and Z
   * @throws std::invalid_argument on any other character
   */
  static PauliString from_label(const std::string& label);

  /// @brief Big-endian label of this string
  std::string to_label() const;

  std::size_t num_qubits() const { return z_.size(); }

  /// @brief True when every qubit carries the identity
  bool is_identity() const;

  /// @brief Number of qubits acted on non-trivially
  std::size_t weight() const;

  /**
   * @brief Pauli character acting on a qubit ('I', 'X', 'Y' or 'Z')
   * @throws std::out_of_range if @p qubit is not below num_qubits()
   */
  char get_pauli(std::size_t qubit) const;

  const std::vector<std::uint8_t>& get_z() const { return z_; }
  const std::vector<std::uint8_t>& get_x() const { return x_; }

  /**
   * @brief Dense matrix of the string, little-endian over qubits
   *
   * Global qubit i is bit i of the basis index.
   */
  Eigen::MatrixXcd to_matrix() const;

  bool operator==(const PauliString& other) const {
    return z_ == other.z_ && x_ == other.x_;
  }
  bool operator!=(const PauliString& other) const { return !(*this == other); }

 private:
  std::vector<std::uint8_t> z_;
  std::vector<std::uint8_t> x_;
};

/**
 * @class QubitOperator
 * @brief Weighted sum of Pauli strings over a fixed number of qubits
 *
 * The operator keeps its terms in the order they were given; duplicate
 * strings are only merged by simplify(). Coefficients are complex so that
 * non-Hermitian decompositions can be represented and detected.
 *
 * Example:
 * @code
 * auto op = QubitOperator::from_labels({{0.5, "II"}, {0.5, "ZZ"}});
 * auto m = op->to_matrix();  // 4 x 4 diagonal matrix
 * @endcode
 */
class QubitOperator {
 public:
  using PauliTerm = std::pair<std::complex<double>, PauliString>;

  /**
   * @brief Construct from a list of terms
   * @param num_qubits Number of qubits the operator acts on
   * @param terms Coefficient and string pairs
   * @throws std::invalid_argument if a string does not act on @p num_qubits
   * qubits
   */
  QubitOperator(std::size_t num_qubits, std::vector<PauliTerm> terms);

  /**
   * @brief Construct from (coefficient, label) pairs
   *
   * The qubit count is taken from the first label.
   *
   * @throws std::invalid_argument if the list is empty or labels differ in
   * length
   */
  static std::shared_ptr<QubitOperator> from_labels(
      const std::vector<std::pair<std::complex<double>, std::string>>& terms);

  /**
   * @brief Pauli decomposition of a dense matrix
   *
   * The coefficient of P is Tr(P M) / 2^n. Terms with magnitude at or below
   * @p threshold are dropped. Terms are emitted in label order with
   * I < X < Y < Z per qubit, the highest qubit being the most significant.
   *
   * @param matrix Square matrix of dimension 2^n
   * @param threshold Magnitude cutoff for retained terms
   * @throws std::invalid_argument if the matrix is not square or its dimension
   * is not a power of two
   */
  static std::shared_ptr<QubitOperator> from_matrix(
      const Eigen::MatrixXcd& matrix, double threshold = 1e-12);

  std::size_t num_qubits() const { return num_qubits_; }
  std::size_t num_terms() const { return terms_.size(); }
  const std::vector<PauliTerm>& get_terms() const { return terms_; }

  /// @brief Operator with conjugated coefficients
  QubitOperator adjoint() const;

  /**
   * @brief Merge duplicate strings and drop terms with |c| <= @p threshold
   *
   * The first occurrence of each string fixes its position in the result.
   */
  QubitOperator simplify(double threshold = 0.0) const;

  /**
   * @brief Whether the operator is Hermitian
   *
   * After merging duplicate strings, every coefficient must have an
   * imaginary part no larger than @p tolerance in magnitude.
   */
  bool is_hermitian(double tolerance = 1e-12) const;

  /// @brief Sum of the absolute values of all coefficients
  double one_norm() const;

  /// @brief Dense matrix representation, little-endian over qubits
  Eigen::MatrixXcd to_matrix() const;

  std::string get_summary() const;

 private:
  std::size_t num_qubits_;
  std::vector<PauliTerm> terms_;
};

}  // namespace qpe::data

template <>
struct std::hash<qpe::data::PauliString> {
  std::size_t operator()(const qpe::data::PauliString& s) const noexcept {
    std::size_t seed = s.num_qubits();
    for (std::size_t i = 0; i < s.num_qubits(); ++i) {
      seed = qpe::utils::hash_combine(seed, s.get_z()[i], s.get_x()[i]);
    }
    return seed;
  }
};
