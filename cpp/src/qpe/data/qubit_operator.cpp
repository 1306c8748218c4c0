// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <bit>
#include <cmath>
#include <qpe/data/qubit_operator.hpp>
#include <qpe/utils/logger.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace qpe::data {

namespace {

/// Largest register for which dense matrices are built
constexpr std::size_t max_dense_qubits = 14;

struct PauliMasks {
  std::uint64_t z = 0;
  std::uint64_t x = 0;
  int num_y = 0;
};

PauliMasks to_masks(const PauliString& pauli) {
  PauliMasks masks;
  for (std::size_t q = 0; q < pauli.num_qubits(); ++q) {
    if (pauli.get_z()[q]) masks.z |= (std::uint64_t{1} << q);
    if (pauli.get_x()[q]) masks.x |= (std::uint64_t{1} << q);
    if (pauli.get_z()[q] && pauli.get_x()[q]) ++masks.num_y;
  }
  return masks;
}

/// i^k for integer k
std::complex<double> i_power(int k) {
  switch (((k % 4) + 4) % 4) {
    case 0:
      return {1.0, 0.0};
    case 1:
      return {0.0, 1.0};
    case 2:
      return {-1.0, 0.0};
    default:
      return {0.0, -1.0};
  }
}

/// Phase picked up by basis state |k> under P: P|k> = phase(k) |k ^ x>
std::complex<double> column_phase(const PauliMasks& masks, std::uint64_t k,
                                  const std::complex<double>& y_phase) {
  return (std::popcount(k & masks.z) % 2 == 0) ? y_phase : -y_phase;
}

void check_dense_size(std::size_t num_qubits) {
  if (num_qubits > max_dense_qubits) {
    throw std::length_error("Dense matrices are limited to " +
                            std::to_string(max_dense_qubits) +
                            " qubits, requested " +
                            std::to_string(num_qubits));
  }
}

}  // namespace

// === PauliString ===

PauliString::PauliString(std::size_t num_qubits)
    : z_(num_qubits, 0), x_(num_qubits, 0) {}

PauliString::PauliString(std::vector<std::uint8_t> z,
                         std::vector<std::uint8_t> x)
    : z_(std::move(z)), x_(std::move(x)) {
  if (z_.size() != x_.size()) {
    throw std::invalid_argument(
        "Pauli string Z and X bit vectors must have equal length");
  }
}

PauliString PauliString::from_label(const std::string& label) {
  const std::size_t n = label.size();
  PauliString result(n);
  for (std::size_t pos = 0; pos < n; ++pos) {
    const std::size_t qubit = n - 1 - pos;
    switch (label[pos]) {
      case 'I':
        break;
      case 'X':
        result.x_[qubit] = 1;
        break;
      case 'Y':
        result.z_[qubit] = 1;
        result.x_[qubit] = 1;
        break;
      case 'Z':
        result.z_[qubit] = 1;
        break;
      default:
        throw std::invalid_argument("Invalid Pauli label character '" +
                                    std::string(1, label[pos]) + "' in '" +
                                    label + "'");
    }
  }
  return result;
}

char PauliString::get_pauli(std::size_t qubit) const {
  if (qubit >= num_qubits()) {
    throw std::out_of_range("Qubit index " + std::to_string(qubit) +
                            " out of range for Pauli string on " +
                            std::to_string(num_qubits()) + " qubits");
  }
  static constexpr char symbols[2][2] = {{'I', 'X'}, {'Z', 'Y'}};
  return symbols[z_[qubit]][x_[qubit]];
}

std::string PauliString::to_label() const {
  std::string label;
  label.reserve(num_qubits());
  for (std::size_t pos = 0; pos < num_qubits(); ++pos) {
    label += get_pauli(num_qubits() - 1 - pos);
  }
  return label;
}

bool PauliString::is_identity() const { return weight() == 0; }

std::size_t PauliString::weight() const {
  std::size_t w = 0;
  for (std::size_t q = 0; q < num_qubits(); ++q) {
    if (z_[q] || x_[q]) ++w;
  }
  return w;
}

Eigen::MatrixXcd PauliString::to_matrix() const {
  check_dense_size(num_qubits());
  const std::uint64_t dim = std::uint64_t{1} << num_qubits();
  const auto masks = to_masks(*this);
  const auto y_phase = i_power(masks.num_y);

  Eigen::MatrixXcd matrix = Eigen::MatrixXcd::Zero(dim, dim);
  for (std::uint64_t k = 0; k < dim; ++k) {
    matrix(k ^ masks.x, k) = column_phase(masks, k, y_phase);
  }
  return matrix;
}

// === QubitOperator ===

QubitOperator::QubitOperator(std::size_t num_qubits,
                             std::vector<PauliTerm> terms)
    : num_qubits_(num_qubits), terms_(std::move(terms)) {
  QPE_LOG_TRACE_ENTERING();
  for (const auto& [coefficient, pauli] : terms_) {
    if (pauli.num_qubits() != num_qubits_) {
      throw std::invalid_argument(
          "Pauli string '" + pauli.to_label() + "' acts on " +
          std::to_string(pauli.num_qubits()) + " qubits, expected " +
          std::to_string(num_qubits_));
    }
  }
}

std::shared_ptr<QubitOperator> QubitOperator::from_labels(
    const std::vector<std::pair<std::complex<double>, std::string>>& terms) {
  QPE_LOG_TRACE_ENTERING();
  if (terms.empty()) {
    throw std::invalid_argument(
        "At least one term is required to infer the qubit count");
  }
  std::vector<PauliTerm> pauli_terms;
  pauli_terms.reserve(terms.size());
  for (const auto& [coefficient, label] : terms) {
    pauli_terms.emplace_back(coefficient, PauliString::from_label(label));
  }
  return std::make_shared<QubitOperator>(terms.front().second.size(),
                                         std::move(pauli_terms));
}

std::shared_ptr<QubitOperator> QubitOperator::from_matrix(
    const Eigen::MatrixXcd& matrix, double threshold) {
  QPE_LOG_TRACE_ENTERING();
  if (matrix.rows() != matrix.cols()) {
    throw std::invalid_argument("Matrix must be square, got " +
                                std::to_string(matrix.rows()) + " x " +
                                std::to_string(matrix.cols()));
  }
  const auto dim = static_cast<std::uint64_t>(matrix.rows());
  if (dim == 0 || !std::has_single_bit(dim)) {
    throw std::invalid_argument(
        "Matrix dimension must be a power of two, got " + std::to_string(dim));
  }
  const std::size_t n = static_cast<std::size_t>(std::countr_zero(dim));
  check_dense_size(n);

  // Base-4 digit d of the code selects the Pauli on qubit d: 0=I 1=X 2=Y 3=Z
  static constexpr std::uint8_t z_bits[4] = {0, 0, 1, 1};
  static constexpr std::uint8_t x_bits[4] = {0, 1, 1, 0};

  std::vector<PauliTerm> terms;
  const std::uint64_t num_strings = std::uint64_t{1} << (2 * n);
  for (std::uint64_t code = 0; code < num_strings; ++code) {
    std::vector<std::uint8_t> z(n), x(n);
    for (std::size_t q = 0; q < n; ++q) {
      const auto digit = (code >> (2 * q)) & 3;
      z[q] = z_bits[digit];
      x[q] = x_bits[digit];
    }
    PauliString pauli(std::move(z), std::move(x));
    const auto masks = to_masks(pauli);
    const auto y_phase = i_power(masks.num_y);

    std::complex<double> trace(0.0, 0.0);
    for (std::uint64_t k = 0; k < dim; ++k) {
      trace += column_phase(masks, k, y_phase) * matrix(k, k ^ masks.x);
    }
    const auto coefficient = trace / static_cast<double>(dim);
    if (std::abs(coefficient) > threshold) {
      terms.emplace_back(coefficient, std::move(pauli));
    }
  }

  QPE_LOGGER().debug("Pauli decomposition of {}x{} matrix kept {} terms", dim,
                     dim, terms.size());
  return std::make_shared<QubitOperator>(n, std::move(terms));
}

QubitOperator QubitOperator::adjoint() const {
  QPE_LOG_TRACE_ENTERING();
  std::vector<PauliTerm> terms;
  terms.reserve(terms_.size());
  for (const auto& [coefficient, pauli] : terms_) {
    terms.emplace_back(std::conj(coefficient), pauli);
  }
  return QubitOperator(num_qubits_, std::move(terms));
}

QubitOperator QubitOperator::simplify(double threshold) const {
  QPE_LOG_TRACE_ENTERING();
  std::unordered_map<PauliString, std::size_t> positions;
  std::vector<PauliTerm> merged;
  for (const auto& [coefficient, pauli] : terms_) {
    auto [it, inserted] = positions.try_emplace(pauli, merged.size());
    if (inserted) {
      merged.emplace_back(coefficient, pauli);
    } else {
      merged[it->second].first += coefficient;
    }
  }

  std::vector<PauliTerm> kept;
  kept.reserve(merged.size());
  for (auto& term : merged) {
    if (std::abs(term.first) > threshold) {
      kept.push_back(std::move(term));
    }
  }
  return QubitOperator(num_qubits_, std::move(kept));
}

bool QubitOperator::is_hermitian(double tolerance) const {
  QPE_LOG_TRACE_ENTERING();
  const auto merged = simplify();
  for (const auto& [coefficient, pauli] : merged.get_terms()) {
    if (std::abs(coefficient.imag()) > tolerance) {
      return false;
    }
  }
  return true;
}

double QubitOperator::one_norm() const {
  double norm = 0.0;
  for (const auto& [coefficient, pauli] : terms_) {
    norm += std::abs(coefficient);
  }
  return norm;
}

Eigen::MatrixXcd QubitOperator::to_matrix() const {
  QPE_LOG_TRACE_ENTERING();
  check_dense_size(num_qubits_);
  const std::uint64_t dim = std::uint64_t{1} << num_qubits_;
  Eigen::MatrixXcd matrix = Eigen::MatrixXcd::Zero(dim, dim);
  for (const auto& [coefficient, pauli] : terms_) {
    const auto masks = to_masks(pauli);
    const auto y_phase = i_power(masks.num_y);
    for (std::uint64_t k = 0; k < dim; ++k) {
      matrix(k ^ masks.x, k) += coefficient * column_phase(masks, k, y_phase);
    }
  }
  return matrix;
}

std::string QubitOperator::get_summary() const {
  QPE_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "QubitOperator(" << num_qubits_ << " qubits, " << terms_.size()
      << " terms, one-norm " << one_norm() << ")";
  constexpr std::size_t max_listed = 8;
  for (std::size_t i = 0; i < terms_.size() && i < max_listed; ++i) {
    oss << "\n  " << terms_[i].first << " * " << terms_[i].second.to_label();
  }
  if (terms_.size() > max_listed) {
    oss << "\n  ... (" << terms_.size() - max_listed << " more)";
  }
  return oss.str();
}

}  // namespace qpe::data
