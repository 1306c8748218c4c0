// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <qpe/data/circuit.hpp>
#include <string>

namespace qpe::data {

/**
 * @class CircuitBuildResult
 * @brief Output of a phase estimation circuit construction
 *
 * Bundles the assembled circuit with the registers it acts on and the
 * constants needed to turn an ancilla measurement into an eigenvalue
 * estimate. All members are fixed at construction.
 */
class CircuitBuildResult {
 public:
  /// Largest ancilla register whose outcomes fit a 64-bit basis index
  static constexpr std::size_t max_ancilla_qubits = 63;

  /**
   * @brief Constructor
   * @param circuit Assembled circuit (registers: ancilla, then input)
   * @param input_register Register holding the state whose eigenvalue is
   * estimated
   * @param ancilla_register Register holding the phase readout
   * @param scaling Evolution time used for the controlled evolutions
   * @param ancilla_phase_coefficient Identity-term coefficient applied as a
   * global phase on the ancillas, if the operator had one
   * @param negative_evals Whether ancilla qubit 0 carries a sign bit
   * @throws std::invalid_argument if @p circuit is null or lacks either
   * register, or if the ancilla register is empty or exceeds
   * max_ancilla_qubits
   */
  CircuitBuildResult(std::shared_ptr<Circuit> circuit,
                     QuantumRegister input_register,
                     QuantumRegister ancilla_register, double scaling,
                     std::optional<double> ancilla_phase_coefficient,
                     bool negative_evals);

  std::shared_ptr<Circuit> get_circuit() const { return circuit_; }
  const QuantumRegister& get_input_register() const { return input_register_; }
  const QuantumRegister& get_ancilla_register() const {
    return ancilla_register_;
  }
  double get_scaling() const { return scaling_; }
  std::optional<double> get_ancilla_phase_coefficient() const {
    return ancilla_phase_coefficient_;
  }
  bool has_negative_evals() const { return negative_evals_; }

  /**
   * @brief Convert an ancilla measurement outcome into an eigenvalue estimate
   *
   * The outcome is the little-endian basis index over the ancilla register.
   * Ancilla qubit i holds bit (m - 1 - i) of the phase integer y. Without
   * negative eigenvalues the estimate is 2 pi y / (2^m t). With negative
   * eigenvalues qubit 0 is the sign and qubits 1..m-1 the magnitude, with
   * qubit 1 most significant.
   *
   * @param ancilla_outcome Basis index in [0, 2^m)
   * @return Estimated eigenvalue
   * @throws std::out_of_range if the outcome does not fit the register
   */
  double decode_eigenvalue(std::uint64_t ancilla_outcome) const;

  std::string get_summary() const;

  /**
   * @brief JSON record of the build: circuit, registers and decoding
   * constants
   */
  nlohmann::json to_json() const;

 private:
  std::shared_ptr<Circuit> circuit_;
  QuantumRegister input_register_;
  QuantumRegister ancilla_register_;
  double scaling_;
  std::optional<double> ancilla_phase_coefficient_;
  bool negative_evals_;
};

}  // namespace qpe::data
