// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <iomanip>
#include <numbers>
#include <qpe/data/circuit_build_result.hpp>
#include <qpe/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

namespace qpe::data {

CircuitBuildResult::CircuitBuildResult(
    std::shared_ptr<Circuit> circuit, QuantumRegister input_register,
    QuantumRegister ancilla_register, double scaling,
    std::optional<double> ancilla_phase_coefficient, bool negative_evals)
    : circuit_(std::move(circuit)),
      input_register_(std::move(input_register)),
      ancilla_register_(std::move(ancilla_register)),
      scaling_(scaling),
      ancilla_phase_coefficient_(ancilla_phase_coefficient),
      negative_evals_(negative_evals) {
  QPE_LOG_TRACE_ENTERING();
  if (!circuit_) {
    throw std::invalid_argument("CircuitBuildResult requires a circuit");
  }
  if (ancilla_register_.size() == 0 ||
      ancilla_register_.size() > max_ancilla_qubits) {
    throw std::invalid_argument(
        "Ancilla register must hold between 1 and " +
        std::to_string(max_ancilla_qubits) + " qubits");
  }
  for (const auto* reg : {&input_register_, &ancilla_register_}) {
    if (!circuit_->has_register(reg->name())) {
      throw std::invalid_argument("Circuit does not contain register '" +
                                  reg->name() + "'");
    }
  }
}

double CircuitBuildResult::decode_eigenvalue(
    std::uint64_t ancilla_outcome) const {
  QPE_LOG_TRACE_ENTERING();
  const std::size_t m = ancilla_register_.size();
  const std::uint64_t num_outcomes = std::uint64_t{1} << m;
  if (ancilla_outcome >= num_outcomes) {
    throw std::out_of_range("Ancilla outcome " +
                            std::to_string(ancilla_outcome) +
                            " does not fit a register of " + std::to_string(m) +
                            " qubits");
  }

  auto bit = [ancilla_outcome](std::size_t qubit) {
    return (ancilla_outcome >> qubit) & 1;
  };

  const std::size_t first_magnitude_qubit = negative_evals_ ? 1 : 0;
  std::uint64_t y = 0;
  for (std::size_t i = first_magnitude_qubit; i < m; ++i) {
    y |= bit(i) << (m - 1 - i);
  }

  const double value = 2.0 * std::numbers::pi * static_cast<double>(y) /
                       (static_cast<double>(num_outcomes) * scaling_);
  return (negative_evals_ && bit(0)) ? -value : value;
}

std::string CircuitBuildResult::get_summary() const {
  QPE_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "CircuitBuildResult(input: " << input_register_.size()
      << " qubits, ancilla: " << ancilla_register_.size()
      << " qubits, scaling: " << std::setprecision(10) << scaling_;
  if (ancilla_phase_coefficient_) {
    oss << ", phase offset: " << *ancilla_phase_coefficient_;
  }
  if (negative_evals_) {
    oss << ", signed";
  }
  oss << ", " << circuit_->num_gates() << " gates)";
  return oss.str();
}

nlohmann::json CircuitBuildResult::to_json() const {
  QPE_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["circuit"] = circuit_->to_json();
  j["input_register"] = {{"name", input_register_.name()},
                         {"size", input_register_.size()}};
  j["ancilla_register"] = {{"name", ancilla_register_.name()},
                           {"size", ancilla_register_.size()}};
  j["scaling"] = scaling_;
  if (ancilla_phase_coefficient_) {
    j["ancilla_phase_coefficient"] = *ancilla_phase_coefficient_;
  }
  j["negative_evals"] = negative_evals_;
  return j;
}

}  // namespace qpe::data
