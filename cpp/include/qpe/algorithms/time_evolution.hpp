// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstddef>
#include <memory>
#include <qpe/algorithms/algorithm.hpp>
#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/data/circuit.hpp>
#include <qpe/data/qubit_operator.hpp>
#include <string>

namespace qpe::algorithms {

/**
 * @brief Parameters of a controlled time evolution
 */
struct EvolutionParameters {
  /// Evolution time t of U = exp(i H t)
  double evolution_time = 0.0;
  /// Product formula: "trotter" or "suzuki"
  std::string expansion_mode = "trotter";
  /// Suzuki recursion order (the formula has order 2 * expansion_order)
  std::size_t expansion_order = 1;
  /// Number of product-formula steps per application of U
  std::size_t num_time_slices = 1;
  /// Decompose controlled rotations into single-qubit rotations and CX
  bool use_basis_gates = true;
};

/**
 * @brief Abstract base class for phase-kickback evolution synthesizers
 *
 * A synthesizer produces the core of a phase estimation circuit: Hadamards
 * on the ancilla register, ancilla j controlling U^(2^j) with
 * U = exp(i H t) on the state register, and finally the supplied inverse
 * Fourier transform over the ancillas. The returned circuit holds the
 * ancilla register first and the state register second.
 *
 * Example usage:
 * @code
 * auto synthesizer = qpe::algorithms::make_trotter_suzuki_synthesizer();
 * EvolutionParameters params;
 * params.evolution_time = 1.0;
 * auto circuit = synthesizer->run(op, params, state, ancilla, *iqft);
 * @endcode
 */
class TimeEvolutionSynthesizer
    : public Algorithm<TimeEvolutionSynthesizer, std::shared_ptr<data::Circuit>,
                       const data::QubitOperator&, const EvolutionParameters&,
                       const data::QuantumRegister&,
                       const data::QuantumRegister&, const FourierTransform&> {
 public:
  TimeEvolutionSynthesizer() = default;
  virtual ~TimeEvolutionSynthesizer() = default;

  /**
   * @brief Build the controlled evolution and phase readout circuit
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param op Hermitian operator H
   * @param params Evolution time and product-formula parameters
   * @param state_register Register U acts on
   * @param ancilla_register Register receiving the phase
   * @param iqft Inverse Fourier transform sized to the ancilla register
   * \endcond
   *
   * @return Newly created circuit over (ancilla, state)
   * @throws std::invalid_argument if the operator has complex coefficients or
   * register sizes do not fit
   */
  using Algorithm::run;

  std::string type_name() const override { return "time_evolution"; }
};

/**
 * @brief Create the reference Trotter/Suzuki product-formula synthesizer
 */
std::unique_ptr<TimeEvolutionSynthesizer> make_trotter_suzuki_synthesizer();

}  // namespace qpe::algorithms
