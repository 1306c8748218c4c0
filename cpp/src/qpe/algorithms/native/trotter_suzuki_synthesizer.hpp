// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <limits>
#include <qpe/algorithms/time_evolution.hpp>
#include <qpe/data/settings.hpp>
#include <utility>
#include <vector>

namespace qpe::algorithms::native {

/**
 * @class TrotterSuzukiSettings
 * @brief Settings of the product-formula synthesizer
 *
 * Default settings include:
 * - hermiticity_tolerance: 1e-12 - Largest tolerated imaginary part of a
 *   merged coefficient
 */
class TrotterSuzukiSettings : public data::Settings {
 public:
  TrotterSuzukiSettings() : data::Settings() {
    set_default("hermiticity_tolerance", 1e-12,
                "Largest tolerated imaginary part of a coefficient",
                data::BoundConstraint<double>{
                    0.0, std::numeric_limits<double>::max()});
  }
};

/**
 * @class TrotterSuzukiSynthesizer
 * @brief Controlled evolution by first-order Trotter or symmetric Suzuki
 * product formulas
 *
 * Each factor exp(i theta P) is rendered as a basis change onto Z (H for X,
 * RX(pi/2) for Y), a CX parity ladder over the qubits P acts on, a controlled
 * RZ(-2 theta) from the ancilla onto the last of those qubits, and the
 * uncomputation of ladder and basis change. The identity coefficient becomes
 * a U1 phase on each ancilla.
 */
class TrotterSuzukiSynthesizer : public TimeEvolutionSynthesizer {
 public:
  /// One factor exp(i angle P) of a product formula
  using Factor = std::pair<double, const data::PauliString*>;

  TrotterSuzukiSynthesizer() {
    _settings = std::make_unique<TrotterSuzukiSettings>();
  }

  ~TrotterSuzukiSynthesizer() override = default;

  std::string name() const final { return "trotter_suzuki"; }

  /**
   * @brief Factors of one product-formula step exp(i H dt)
   *
   * "trotter" yields exp(i c_k P_k dt) for each term in order. "suzuki" yields
   * the recursive symmetric formula of order 2 * order built from the
   * half-step sweep forward and back.
   *
   * @param terms Real coefficients and strings of the non-identity terms
   * @param dt Step length
   * @param mode "trotter" or "suzuki"
   * @param order Suzuki recursion order, at least 1
   */
  static std::vector<Factor> product_formula(
      const std::vector<std::pair<double, data::PauliString>>& terms,
      double dt, const std::string& mode, std::size_t order);

 protected:
  std::shared_ptr<data::Circuit> _run_impl(
      const data::QubitOperator& op, const EvolutionParameters& params,
      const data::QuantumRegister& state_register,
      const data::QuantumRegister& ancilla_register,
      const FourierTransform& iqft) const override;
};

}  // namespace qpe::algorithms::native
