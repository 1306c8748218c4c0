// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <qpe/algorithms/algorithm.hpp>
#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/algorithms/time_evolution.hpp>
#include <qpe/data/circuit.hpp>
#include <qpe/data/circuit_build_result.hpp>
#include <qpe/data/qubit_operator.hpp>
#include <qpe/data/settings.hpp>
#include <string>
#include <utility>

namespace qpe::algorithms {

/**
 * @class PhaseEstimationSettings
 * @brief Settings of the phase estimation circuit builder
 *
 * Default settings include:
 * - num_time_slices: 1 - Product-formula steps per application of U
 * - expansion_mode: "trotter" - Product formula ("trotter" or "suzuki")
 * - expansion_order: 1 - Suzuki recursion order
 * - num_ancillae: 1 - Size of the phase readout register, at most 63
 * - evo_time: 0.0 - Evolution time; 0 derives it from the spectral bound
 * - use_basis_gates: true - Decompose controlled rotations into RZ and CX
 * - hermitian_matrix: true - Whether the input matrix is Hermitian
 * - negative_evals: false - Reserve a sign qubit for negative eigenvalues
 */
class PhaseEstimationSettings : public data::Settings {
 public:
  PhaseEstimationSettings() : data::Settings() {
    constexpr auto int_max = std::numeric_limits<int64_t>::max();
    set_default("num_time_slices", int64_t(1),
                "Product-formula steps per application of U",
                data::BoundConstraint<int64_t>{1, int_max});
    set_default("expansion_mode", std::string("trotter"),
                "Product formula used for the evolution",
                data::ListConstraint<std::string>{{"trotter", "suzuki"}});
    set_default("expansion_order", int64_t(1), "Suzuki recursion order",
                data::BoundConstraint<int64_t>{1, int_max});
    set_default("num_ancillae", int64_t(1), "Size of the ancilla register",
                data::BoundConstraint<int64_t>{
                    1, static_cast<int64_t>(
                           data::CircuitBuildResult::max_ancilla_qubits)});
    set_default("evo_time", 0.0,
                "Evolution time; 0 derives it from the spectral bound",
                data::BoundConstraint<double>{
                    0.0, std::numeric_limits<double>::max()});
    set_default("use_basis_gates", true,
                "Decompose controlled rotations into RZ and CX");
    set_default("hermitian_matrix", true,
                "Whether the input matrix is Hermitian");
    set_default("negative_evals", false,
                "Reserve ancilla qubit 0 as a sign bit");
  }
};

/**
 * @brief Constants derived from the operator's spectral bound
 */
struct SpectralConstants {
  /// Sum of absolute coefficient values, an upper bound on the spectral norm
  double spectral_bound = 0.0;
  /// Evolution time t of U = exp(i H t)
  double evolution_time = 0.0;
  /// Coefficient of the identity term, if the operator has one
  std::optional<double> ancilla_phase_coefficient;
};

/**
 * @brief Derive the evolution time and the identity phase offset
 *
 * The spectral bound is the sum of absolute coefficients. When no evolution
 * time is supplied it is (1 - 2^-a) 2 pi / bound, or (1/2 - 2^-a) 2 pi / bound
 * when negative eigenvalues must be represented, so that the largest
 * eigenvalue maps just below the largest representable phase.
 *
 * @param op Operator in Pauli form
 * @param num_ancillae Size a of the ancilla register
 * @param negative_evals Whether ancilla qubit 0 is a sign bit
 * @param evolution_time Fixed evolution time, if any
 * @throws qpe::ConfigurationError if the operator has more than one identity
 * term, or if the bound is zero and the time must be derived
 * @throws std::invalid_argument if num_ancillae is zero or a supplied time is
 * not positive
 */
SpectralConstants compute_spectral_constants(
    const data::QubitOperator& op, std::size_t num_ancillae,
    bool negative_evals, std::optional<double> evolution_time = std::nullopt);

/**
 * @brief Embed a square matrix A into the Hermitian matrix [[0, A], [A^H, 0]]
 * @throws std::invalid_argument if @p matrix is not square
 */
Eigen::MatrixXcd hermitize(const Eigen::MatrixXcd& matrix);

/**
 * @brief Operator and adjusted settings ready for phase estimation
 */
struct EigenvalueProblem {
  std::shared_ptr<const data::QubitOperator> op;
  std::shared_ptr<PhaseEstimationSettings> settings;
};

/**
 * @brief Turn a dense matrix and user settings into an eigenvalue problem
 *
 * When negative eigenvalues are requested or the matrix is not Hermitian,
 * negative_evals is switched on and num_ancillae is increased by one for the
 * sign bit. A non-Hermitian matrix is hermitized first, so the estimated
 * values are its singular values with both signs. The inputs are not
 * modified.
 *
 * @param matrix Square matrix of dimension 2^n
 * @param settings Settings with any subset of the PhaseEstimationSettings keys
 * @throws qpe::ConfigurationError if the matrix is empty, or if the sign bit
 * would push num_ancillae past data::CircuitBuildResult::max_ancilla_qubits
 */
EigenvalueProblem prepare_eigenvalue_problem(const Eigen::MatrixXcd& matrix,
                                             const data::Settings& settings);

/**
 * @brief Forward and inverse transforms used to recode negative phases
 *
 * Both act on the magnitude qubits of the ancilla register, i.e. one qubit
 * fewer than the register.
 */
struct NegativeEigenvalueTransforms {
  std::shared_ptr<const FourierTransform> qft;
  std::shared_ptr<const FourierTransform> iqft;
};

/**
 * @class PhaseEstimation
 * @brief Builds quantum phase estimation circuits for a Hermitian operator
 *
 * The builder derives the evolution time from the operator, asks the
 * synthesizer for the controlled evolution with phase readout and, when
 * negative eigenvalues are enabled, recodes the two's-complement phase into
 * sign and magnitude. Sub-components are injected; the settings are copied
 * and locked at construction.
 *
 * Example usage:
 * @code
 * auto op = qpe::data::QubitOperator::from_labels({{0.5, "Z"}});
 * qpe::algorithms::PhaseEstimationSettings settings;
 * settings.set("num_ancillae", 3);
 * qpe::algorithms::PhaseEstimation builder(
 *     op, qpe::algorithms::make_approximate_fourier_transform(3, 2),
 *     qpe::algorithms::make_trotter_suzuki_synthesizer(), settings);
 * auto circuit = builder.construct_circuit("circuit",
 *                                          qpe::data::QuantumRegister("q", 1));
 * @endcode
 */
class PhaseEstimation
    : public Algorithm<PhaseEstimation,
                       std::shared_ptr<data::CircuitBuildResult>,
                       const data::QuantumRegister&> {
 public:
  /**
   * @brief Constructor
   * @param op Operator whose eigenvalues are estimated
   * @param iqft Inverse Fourier transform over num_ancillae qubits
   * @param synthesizer Controlled evolution synthesizer
   * @param settings Settings with any subset of the PhaseEstimationSettings
   * keys
   * @param negative_eigenvalue_transforms Transforms over num_ancillae - 1
   * qubits, required when negative_evals is set
   * @throws qpe::ConfigurationError if a component is missing or mis-sized,
   * negative_evals is set with fewer than two ancillae, the operator has more
   * than one identity term, or the evolution time cannot be derived
   */
  PhaseEstimation(std::shared_ptr<const data::QubitOperator> op,
                  std::shared_ptr<const FourierTransform> iqft,
                  std::shared_ptr<const TimeEvolutionSynthesizer> synthesizer,
                  const data::Settings& settings = PhaseEstimationSettings(),
                  NegativeEigenvalueTransforms negative_eigenvalue_transforms =
                      NegativeEigenvalueTransforms{});

  ~PhaseEstimation() override = default;

  /**
   * @brief Build the circuit without touching the builder state
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param state_register Register holding the input state; must match the
   * operator's qubit count and must not be named "a"
   * \endcond
   *
   * @return Circuit with register and scaling metadata
   */
  using Algorithm::run;

  /// @brief (operator qubits, ancilla qubits)
  std::pair<std::size_t, std::size_t> get_register_sizes() const;

  /// @brief Evolution time used for the controlled evolutions
  double get_scaling() const { return constants_.evolution_time; }

  /// @brief Identity coefficient applied as ancilla phase, if any
  std::optional<double> get_ancilla_phase_coefficient() const {
    return constants_.ancilla_phase_coefficient;
  }

  /// @brief Sum of absolute coefficient values of the operator
  double get_spectral_bound() const { return constants_.spectral_bound; }

  bool has_negative_evals() const { return negative_evals_; }

  std::shared_ptr<const data::QubitOperator> get_operator() const {
    return op_;
  }

  /**
   * @brief Build the circuit and record it as the builder's current circuit
   * @param mode Must be "circuit"
   * @param state_register Register holding the input state
   * @throws qpe::UnsupportedOperationError for mode "vector"
   * @throws qpe::ConfigurationError for any other mode
   * @throws std::invalid_argument if the register does not fit the operator
   */
  std::shared_ptr<data::Circuit> construct_circuit(
      const std::string& mode, const data::QuantumRegister& state_register);

  /// @throws std::runtime_error before construct_circuit has been called
  std::shared_ptr<data::Circuit> get_circuit() const;
  /// @throws std::runtime_error before construct_circuit has been called
  const data::QuantumRegister& get_input_register() const;
  /// @throws std::runtime_error before construct_circuit has been called
  const data::QuantumRegister& get_output_register() const;

  std::string name() const override { return "phase_estimation"; }

  std::string type_name() const override { return "eigenvalue_estimator"; }

 protected:
  std::shared_ptr<data::CircuitBuildResult> _run_impl(
      const data::QuantumRegister& state_register) const override;

 private:
  std::shared_ptr<const data::QubitOperator> op_;
  std::shared_ptr<const FourierTransform> iqft_;
  std::shared_ptr<const TimeEvolutionSynthesizer> synthesizer_;
  NegativeEigenvalueTransforms negative_transforms_;
  std::size_t num_ancillae_;
  bool negative_evals_;
  SpectralConstants constants_;

  std::shared_ptr<data::CircuitBuildResult> last_result_;

  void _handle_negative_evals(data::Circuit& circuit,
                              const data::QuantumRegister& ancilla) const;
  const data::CircuitBuildResult& _require_result() const;
};

/**
 * @brief Build a phase estimation circuit builder from a dense matrix
 *
 * Runs prepare_eigenvalue_problem, then requests the inverse transform over
 * num_ancillae qubits and, when negative eigenvalues are enabled, a forward
 * and an inverse transform over num_ancillae - 1 qubits from @p provider.
 *
 * @throws qpe::ConfigurationError if the matrix is empty or the provider is
 * not callable
 */
std::unique_ptr<PhaseEstimation> make_phase_estimation(
    const Eigen::MatrixXcd& matrix, const data::Settings& settings,
    std::shared_ptr<const TimeEvolutionSynthesizer> synthesizer,
    const FourierTransformProvider& provider);

}  // namespace qpe::algorithms
