// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "trotter_suzuki_synthesizer.hpp"

#include <cmath>
#include <cstdint>
#include <numbers>
#include <qpe/data/circuit_build_result.hpp>
#include <qpe/errors.hpp>
#include <qpe/utils/logger.hpp>

namespace qpe::algorithms::native {

namespace {

using Factor = TrotterSuzukiSynthesizer::Factor;
using RealTerms = std::vector<std::pair<double, data::PauliString>>;

/// Symmetric second-order sweep: half steps forward, then backward
void append_symmetric_sweep(const RealTerms& terms, double scale,
                            std::vector<Factor>& factors) {
  for (const auto& [coefficient, pauli] : terms) {
    factors.emplace_back(coefficient * scale / 2.0, &pauli);
  }
  for (auto it = terms.rbegin(); it != terms.rend(); ++it) {
    factors.emplace_back(it->first * scale / 2.0, &it->second);
  }
}

/// Suzuki recursion S_k(s) = S_{k-1}(p s)^2 S_{k-1}((1 - 4p) s) S_{k-1}(p s)^2
void append_suzuki(const RealTerms& terms, double scale, std::size_t order,
                   std::vector<Factor>& factors) {
  if (order == 1) {
    append_symmetric_sweep(terms, scale, factors);
    return;
  }
  const double k = static_cast<double>(order);
  const double p = 1.0 / (4.0 - std::pow(4.0, 1.0 / (2.0 * k - 1.0)));
  append_suzuki(terms, p * scale, order - 1, factors);
  append_suzuki(terms, p * scale, order - 1, factors);
  append_suzuki(terms, (1.0 - 4.0 * p) * scale, order - 1, factors);
  append_suzuki(terms, p * scale, order - 1, factors);
  append_suzuki(terms, p * scale, order - 1, factors);
}

/// Controlled RZ, optionally decomposed into RZ and CX
void controlled_rz(data::Circuit& circuit, double angle,
                   const data::Qubit& control, const data::Qubit& target,
                   bool use_basis_gates) {
  if (use_basis_gates) {
    circuit.rz(angle / 2.0, target);
    circuit.cx(control, target);
    circuit.rz(-angle / 2.0, target);
    circuit.cx(control, target);
  } else {
    circuit.crz(angle, control, target);
  }
}

/// Controlled exp(i theta P) on the state register
void controlled_pauli_evolution(data::Circuit& circuit, double theta,
                                const data::PauliString& pauli,
                                const data::Qubit& control,
                                const data::QuantumRegister& state,
                                bool use_basis_gates) {
  std::vector<std::size_t> active;
  for (std::size_t q = 0; q < pauli.num_qubits(); ++q) {
    if (pauli.get_pauli(q) != 'I') active.push_back(q);
  }
  if (active.empty()) {
    return;
  }

  constexpr double half_pi = std::numbers::pi / 2.0;
  for (auto q : active) {
    const char p = pauli.get_pauli(q);
    if (p == 'X') {
      circuit.h(state[q]);
    } else if (p == 'Y') {
      circuit.rx(half_pi, state[q]);
    }
  }
  for (std::size_t i = 0; i + 1 < active.size(); ++i) {
    circuit.cx(state[active[i]], state[active[i + 1]]);
  }

  controlled_rz(circuit, -2.0 * theta, control, state[active.back()],
                use_basis_gates);

  for (std::size_t i = active.size() - 1; i > 0; --i) {
    circuit.cx(state[active[i - 1]], state[active[i]]);
  }
  for (auto q : active) {
    const char p = pauli.get_pauli(q);
    if (p == 'X') {
      circuit.h(state[q]);
    } else if (p == 'Y') {
      circuit.rx(-half_pi, state[q]);
    }
  }
}

}  // namespace

std::vector<Factor> TrotterSuzukiSynthesizer::product_formula(
    const RealTerms& terms, double dt, const std::string& mode,
    std::size_t order) {
  std::vector<Factor> factors;
  if (mode == "trotter") {
    factors.reserve(terms.size());
    for (const auto& [coefficient, pauli] : terms) {
      factors.emplace_back(coefficient * dt, &pauli);
    }
  } else if (mode == "suzuki") {
    if (order < 1) {
      throw std::invalid_argument("Suzuki expansion order must be at least 1");
    }
    append_suzuki(terms, dt, order, factors);
  } else {
    throw ConfigurationError("Unknown expansion mode '" + mode +
                             "', expected \"trotter\" or \"suzuki\"");
  }
  return factors;
}

std::shared_ptr<data::Circuit> TrotterSuzukiSynthesizer::_run_impl(
    const data::QubitOperator& op, const EvolutionParameters& params,
    const data::QuantumRegister& state_register,
    const data::QuantumRegister& ancilla_register,
    const FourierTransform& iqft) const {
  QPE_LOG_TRACE_ENTERING();
  if (state_register.size() != op.num_qubits()) {
    throw std::invalid_argument(
        "State register has " + std::to_string(state_register.size()) +
        " qubits but the operator acts on " + std::to_string(op.num_qubits()));
  }
  if (ancilla_register.size() == 0 ||
      ancilla_register.size() > data::CircuitBuildResult::max_ancilla_qubits) {
    throw std::invalid_argument(
        "Ancilla register must hold between 1 and " +
        std::to_string(data::CircuitBuildResult::max_ancilla_qubits) +
        " qubits");
  }
  if (iqft.num_qubits() != ancilla_register.size()) {
    throw std::invalid_argument(
        "Inverse Fourier transform acts on " +
        std::to_string(iqft.num_qubits()) + " qubits, ancilla register has " +
        std::to_string(ancilla_register.size()));
  }
  if (params.num_time_slices == 0) {
    throw std::invalid_argument("Number of time slices must be at least 1");
  }
  if (!std::isfinite(params.evolution_time)) {
    throw std::invalid_argument("Evolution time must be finite");
  }

  // Merge duplicates so that the identity appears at most once
  const double tolerance = _settings->get<double>("hermiticity_tolerance");
  double identity_coefficient = 0.0;
  RealTerms terms;
  const auto merged = op.simplify();
  for (const auto& [coefficient, pauli] : merged.get_terms()) {
    if (std::abs(coefficient.imag()) > tolerance) {
      throw std::invalid_argument(
          "Time evolution requires a Hermitian operator; term " +
          pauli.to_label() + " has imaginary coefficient part " +
          std::to_string(coefficient.imag()));
    }
    if (pauli.is_identity()) {
      identity_coefficient += coefficient.real();
    } else {
      terms.emplace_back(coefficient.real(), pauli);
    }
  }

  const double t = params.evolution_time;
  const double dt = t / static_cast<double>(params.num_time_slices);
  const auto factors = product_formula(terms, dt, params.expansion_mode,
                                       params.expansion_order);

  auto circuit = std::make_shared<data::Circuit>(
      std::vector<data::QuantumRegister>{ancilla_register, state_register});

  for (const auto& qubit : ancilla_register.qubits()) {
    circuit->h(qubit);
  }

  for (std::size_t j = 0; j < ancilla_register.size(); ++j) {
    const auto control = ancilla_register[j];
    const double power = std::ldexp(1.0, static_cast<int>(j));
    if (identity_coefficient != 0.0) {
      circuit->u1(identity_coefficient * t * power, control);
    }
    const std::uint64_t repetitions = std::uint64_t{1} << j;
    for (std::uint64_t r = 0; r < repetitions; ++r) {
      for (std::size_t s = 0; s < params.num_time_slices; ++s) {
        for (const auto& [theta, pauli] : factors) {
          controlled_pauli_evolution(*circuit, theta, *pauli, control,
                                     state_register, params.use_basis_gates);
        }
      }
    }
  }

  iqft.append(*circuit, ancilla_register.qubits());

  QPE_LOGGER().debug(
      "Controlled evolution: {} terms, {} factors per slice, {} gates",
      terms.size(), factors.size(), circuit->num_gates());
  return circuit;
}

}  // namespace qpe::algorithms::native
