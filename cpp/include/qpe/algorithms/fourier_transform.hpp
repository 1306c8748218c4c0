// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <memory>
#include <qpe/algorithms/algorithm.hpp>
#include <qpe/data/circuit.hpp>
#include <string>
#include <variant>
#include <vector>

namespace qpe::algorithms {

/**
 * @brief Abstract base class for (inverse) quantum Fourier transform builders
 *
 * A FourierTransform is bound to a fixed number of qubits and a direction at
 * construction. It can be rendered either as a dense matrix or as a gate
 * sequence appended to a circuit. Implementations are immutable once built
 * and may be shared between builders.
 *
 * The gate sequences omit the final swap network, so the circuit realises
 * the transform followed by a bit reversal of the output. For the inverse
 * transform on n qubits the circuit unitary is R F where
 * F[y, k] = exp(-2 pi i y k / 2^n) / sqrt(2^n) and R reverses the bit order.
 *
 * Example usage:
 * @code
 * auto iqft = qpe::algorithms::make_approximate_fourier_transform(4, 2);
 * auto result = iqft->construct_circuit("circuit");
 * auto circuit = std::get<std::shared_ptr<qpe::data::Circuit>>(result);
 * @endcode
 */
class FourierTransform
    : public Algorithm<FourierTransform, std::shared_ptr<data::Circuit>,
                       std::shared_ptr<data::Circuit>,
                       const std::vector<data::Qubit>&> {
 public:
  /// Result of construct_circuit: a dense matrix or a circuit
  using Construction =
      std::variant<Eigen::MatrixXcd, std::shared_ptr<data::Circuit>>;

  FourierTransform() = default;
  virtual ~FourierTransform() = default;

  /**
   * @brief Append the transform to a circuit
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param circuit Circuit to append to; a fresh one is created if null
   * @param qubits Target qubits, least significant first; if empty, the
   * circuit must be null and a register "q" is created
   * \endcond
   *
   * @return The circuit the gates were appended to
   * @throws std::invalid_argument if the qubit count differs from
   * num_qubits()
   */
  using Algorithm::run;

  /// @brief Number of qubits the transform acts on
  virtual std::size_t num_qubits() const = 0;

  /// @brief True for the inverse transform, false for the forward one
  virtual bool is_inverse() const = 0;

  /**
   * @brief Exact dense matrix of the transform (without bit reversal)
   *
   * The inverse transform has entries exp(-2 pi i j k / N) / sqrt(N); the
   * forward transform is its conjugate transpose.
   */
  virtual Eigen::MatrixXcd matrix() const = 0;

  /**
   * @brief Append the gate sequence to an existing circuit
   * @throws std::invalid_argument if the qubit count differs from
   * num_qubits()
   */
  void append(data::Circuit& circuit,
              const std::vector<data::Qubit>& qubits) const;

  /**
   * @brief Render the transform in the requested mode
   * @param mode "vector" for the dense matrix, "circuit" for a gate sequence
   * @param qubits Target qubits for circuit mode
   * @param circuit Circuit to append to in circuit mode
   * @throws qpe::ConfigurationError for any other mode
   */
  Construction construct_circuit(
      const std::string& mode, const std::vector<data::Qubit>& qubits = {},
      std::shared_ptr<data::Circuit> circuit = nullptr) const;

  std::string type_name() const override { return "fourier_transform"; }

 protected:
  /**
   * @brief Emit the gates on already validated qubits
   */
  virtual void _append_gates(data::Circuit& circuit,
                             const std::vector<data::Qubit>& qubits) const = 0;

  std::shared_ptr<data::Circuit> _run_impl(
      std::shared_ptr<data::Circuit> circuit,
      const std::vector<data::Qubit>& qubits) const override;
};

/**
 * @brief Builds a Fourier transform for a given size and direction
 *
 * The first argument is the qubit count, the second is true for the inverse
 * transform.
 */
using FourierTransformProvider =
    std::function<std::shared_ptr<const FourierTransform>(std::size_t, bool)>;

/**
 * @brief Create a degree-truncated Fourier transform
 *
 * Controlled-phase interactions between qubits j and k are kept only when
 * 0 < j - k <= degree. A degree of zero keeps only Hadamards; any degree of at
 * least num_qubits - 1 gives the exact transform. Degree counts retained
 * distance, not dropped distance: pass num_qubits - 1, not 0, for the exact
 * transform.
 *
 * @param num_qubits Number of qubits
 * @param degree Maximum qubit distance of retained interactions
 * @param inverse Whether to build the inverse transform
 */
std::unique_ptr<FourierTransform> make_approximate_fourier_transform(
    std::size_t num_qubits, std::size_t degree, bool inverse = true);

/**
 * @brief Provider building approximate transforms of a fixed degree
 *
 * The degree is clamped to the requested qubit count.
 */
FourierTransformProvider make_approximate_fourier_transform_provider(
    std::size_t degree);

}  // namespace qpe::algorithms
