// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <numbers>
#include <qpe/algorithms/phase_estimation.hpp>
#include <qpe/errors.hpp>
#include <qpe/utils/logger.hpp>
#include <stdexcept>

namespace qpe::algorithms {

SpectralConstants compute_spectral_constants(
    const data::QubitOperator& op, std::size_t num_ancillae,
    bool negative_evals, std::optional<double> evolution_time) {
  QPE_LOG_TRACE_ENTERING();
  if (num_ancillae == 0) {
    throw std::invalid_argument("Number of ancillae must be at least 1");
  }

  SpectralConstants constants;
  constants.spectral_bound = op.one_norm();

  if (evolution_time.has_value()) {
    if (!(*evolution_time > 0.0) || !std::isfinite(*evolution_time)) {
      throw std::invalid_argument("Evolution time must be positive and finite");
    }
    constants.evolution_time = *evolution_time;
  } else {
    if (constants.spectral_bound == 0.0) {
      throw ConfigurationError(
          "Spectral bound of the operator is zero; an explicit evo_time is "
          "required");
    }
    const double resolution =
        std::ldexp(1.0, -static_cast<int>(num_ancillae));
    const double fraction =
        negative_evals ? 0.5 - resolution : 1.0 - resolution;
    constants.evolution_time =
        fraction * 2.0 * std::numbers::pi / constants.spectral_bound;
  }

  std::size_t identity_terms = 0;
  for (const auto& [coefficient, pauli] : op.get_terms()) {
    if (pauli.is_identity()) {
      ++identity_terms;
      constants.ancilla_phase_coefficient = coefficient.real();
    }
  }
  if (identity_terms > 1) {
    throw ConfigurationError(
        "Operator contains " + std::to_string(identity_terms) +
        " identity terms; simplify it before building the circuit");
  }
  return constants;
}

Eigen::MatrixXcd hermitize(const Eigen::MatrixXcd& matrix) {
  if (matrix.rows() != matrix.cols()) {
    throw std::invalid_argument("Only square matrices can be hermitized");
  }
  const auto n = matrix.rows();
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Zero(2 * n, 2 * n);
  result.topRightCorner(n, n) = matrix;
  result.bottomLeftCorner(n, n) = matrix.adjoint();
  return result;
}

EigenvalueProblem prepare_eigenvalue_problem(const Eigen::MatrixXcd& matrix,
                                             const data::Settings& settings) {
  QPE_LOG_TRACE_ENTERING();
  if (matrix.size() == 0) {
    throw ConfigurationError("Operator required");
  }

  auto problem_settings = std::make_shared<PhaseEstimationSettings>();
  problem_settings->update(settings);

  const bool hermitian = problem_settings->get<bool>("hermitian_matrix");
  const bool negative =
      problem_settings->get<bool>("negative_evals") || !hermitian;
  if (negative) {
    // Ancilla qubit 0 becomes the sign bit
    const auto num_ancillae = problem_settings->get<int64_t>("num_ancillae");
    if (num_ancillae >= static_cast<int64_t>(
                            data::CircuitBuildResult::max_ancilla_qubits)) {
      throw ConfigurationError(
          "No room for a sign qubit: num_ancillae is already " +
          std::to_string(num_ancillae));
    }
    problem_settings->set("negative_evals", true);
    problem_settings->set("num_ancillae", num_ancillae + int64_t(1));
  }

  std::shared_ptr<const data::QubitOperator> op;
  if (hermitian) {
    op = data::QubitOperator::from_matrix(matrix);
  } else {
    op = data::QubitOperator::from_matrix(hermitize(matrix));
  }

  QPE_LOGGER().debug(
      "Eigenvalue problem: {} qubits, {} Pauli terms, {} ancillae{}",
      op->num_qubits(), op->num_terms(),
      problem_settings->get<int64_t>("num_ancillae"),
      negative ? " (with sign bit)" : "");
  return EigenvalueProblem{std::move(op), std::move(problem_settings)};
}

PhaseEstimation::PhaseEstimation(
    std::shared_ptr<const data::QubitOperator> op,
    std::shared_ptr<const FourierTransform> iqft,
    std::shared_ptr<const TimeEvolutionSynthesizer> synthesizer,
    const data::Settings& settings,
    NegativeEigenvalueTransforms negative_eigenvalue_transforms)
    : op_(std::move(op)),
      iqft_(std::move(iqft)),
      synthesizer_(std::move(synthesizer)),
      negative_transforms_(std::move(negative_eigenvalue_transforms)) {
  QPE_LOG_TRACE_ENTERING();
  _settings = std::make_unique<PhaseEstimationSettings>();
  _settings->update(settings);
  _settings->lock();

  if (!op_) {
    throw ConfigurationError("Operator required");
  }
  if (!iqft_) {
    throw ConfigurationError("Inverse Fourier transform component required");
  }
  if (!synthesizer_) {
    throw ConfigurationError("Time evolution synthesizer required");
  }

  num_ancillae_ =
      static_cast<std::size_t>(_settings->get<int64_t>("num_ancillae"));
  negative_evals_ = _settings->get<bool>("negative_evals");

  if (iqft_->num_qubits() != num_ancillae_) {
    throw ConfigurationError(
        "Inverse Fourier transform acts on " +
        std::to_string(iqft_->num_qubits()) + " qubits but num_ancillae is " +
        std::to_string(num_ancillae_));
  }

  if (negative_evals_) {
    if (num_ancillae_ < 2) {
      throw ConfigurationError(
          "negative_evals requires at least 2 ancillae (sign and magnitude)");
    }
    if (!negative_transforms_.qft || !negative_transforms_.iqft) {
      throw ConfigurationError(
          "negative_evals requires a forward and an inverse Fourier transform "
          "over the magnitude qubits");
    }
    const std::size_t magnitude = num_ancillae_ - 1;
    if (negative_transforms_.qft->num_qubits() != magnitude ||
        negative_transforms_.iqft->num_qubits() != magnitude) {
      throw ConfigurationError(
          "Negative eigenvalue transforms must act on " +
          std::to_string(magnitude) + " qubits");
    }
    if (negative_transforms_.qft->is_inverse() ||
        !negative_transforms_.iqft->is_inverse()) {
      throw ConfigurationError(
          "Negative eigenvalue transforms must be a forward and an inverse "
          "transform, in that order");
    }
  }

  const double evo_time = _settings->get<double>("evo_time");
  constants_ = compute_spectral_constants(
      *op_, num_ancillae_, negative_evals_,
      evo_time > 0.0 ? std::optional<double>(evo_time) : std::nullopt);

  QPE_LOGGER().debug(
      "Phase estimation: spectral bound {:.6g}, evolution time {:.6g}, "
      "identity offset {}",
      constants_.spectral_bound, constants_.evolution_time,
      constants_.ancilla_phase_coefficient
          ? std::to_string(*constants_.ancilla_phase_coefficient)
          : std::string("none"));
  QPE_LOGGER().debug("Phase estimation settings:\n{}",
                     _settings->get_summary());
}

std::pair<std::size_t, std::size_t> PhaseEstimation::get_register_sizes()
    const {
  return {op_->num_qubits(), num_ancillae_};
}

std::shared_ptr<data::CircuitBuildResult> PhaseEstimation::_run_impl(
    const data::QuantumRegister& state_register) const {
  QPE_LOG_TRACE_ENTERING();
  if (state_register.size() != op_->num_qubits()) {
    throw std::invalid_argument(
        "State register has " + std::to_string(state_register.size()) +
        " qubits but the operator acts on " +
        std::to_string(op_->num_qubits()));
  }
  if (state_register.name() == "a") {
    throw std::invalid_argument(
        "State register name \"a\" is reserved for the ancilla register");
  }

  const data::QuantumRegister ancilla("a", num_ancillae_);

  EvolutionParameters params;
  params.evolution_time = constants_.evolution_time;
  params.expansion_mode = _settings->get<std::string>("expansion_mode");
  params.expansion_order =
      static_cast<std::size_t>(_settings->get<int64_t>("expansion_order"));
  params.num_time_slices =
      static_cast<std::size_t>(_settings->get<int64_t>("num_time_slices"));
  params.use_basis_gates = _settings->get<bool>("use_basis_gates");

  auto circuit =
      synthesizer_->run(*op_, params, state_register, ancilla, *iqft_);
  if (!circuit) {
    throw std::runtime_error("Time evolution synthesizer returned no circuit");
  }
  if (negative_evals_) {
    _handle_negative_evals(*circuit, ancilla);
  }

  QPE_LOGGER().info("Phase estimation circuit: {} qubits, {} gates",
                    circuit->num_qubits(), circuit->num_gates());
  return std::make_shared<data::CircuitBuildResult>(
      circuit, state_register, ancilla, constants_.evolution_time,
      constants_.ancilla_phase_coefficient, negative_evals_);
}

void PhaseEstimation::_handle_negative_evals(
    data::Circuit& circuit, const data::QuantumRegister& ancilla) const {
  const auto sign = ancilla[0];
  std::vector<data::Qubit> magnitude;
  for (std::size_t i = 1; i < ancilla.size(); ++i) {
    magnitude.push_back(ancilla[i]);
  }

  for (const auto& qubit : magnitude) {
    circuit.cx(sign, qubit);
  }
  negative_transforms_.qft->append(circuit, magnitude);
  for (std::size_t k = 0; k < magnitude.size(); ++k) {
    const auto& target = magnitude[magnitude.size() - 1 - k];
    circuit.cu1(2.0 * std::numbers::pi / std::ldexp(1.0, static_cast<int>(k + 1)),
                sign, target);
  }
  negative_transforms_.iqft->append(circuit, magnitude);
}

std::shared_ptr<data::Circuit> PhaseEstimation::construct_circuit(
    const std::string& mode, const data::QuantumRegister& state_register) {
  QPE_LOG_TRACE_ENTERING();
  if (mode == "vector") {
    throw UnsupportedOperationError(
        "Unitary matrix and state vector simulation is not supported");
  } else if (mode != "circuit") {
    throw ConfigurationError("Mode should be either \"vector\" or \"circuit\", "
                             "got \"" +
                             mode + "\"");
  }
  last_result_ = run(state_register);
  return last_result_->get_circuit();
}

const data::CircuitBuildResult& PhaseEstimation::_require_result() const {
  if (!last_result_) {
    throw std::runtime_error(
        "No circuit has been constructed; call construct_circuit first");
  }
  return *last_result_;
}

std::shared_ptr<data::Circuit> PhaseEstimation::get_circuit() const {
  return _require_result().get_circuit();
}

const data::QuantumRegister& PhaseEstimation::get_input_register() const {
  return _require_result().get_input_register();
}

const data::QuantumRegister& PhaseEstimation::get_output_register() const {
  return _require_result().get_ancilla_register();
}

std::unique_ptr<PhaseEstimation> make_phase_estimation(
    const Eigen::MatrixXcd& matrix, const data::Settings& settings,
    std::shared_ptr<const TimeEvolutionSynthesizer> synthesizer,
    const FourierTransformProvider& provider) {
  QPE_LOG_TRACE_ENTERING();
  auto problem = prepare_eigenvalue_problem(matrix, settings);
  if (!provider) {
    throw ConfigurationError("Fourier transform provider required");
  }
  const auto num_ancillae =
      static_cast<std::size_t>(problem.settings->get<int64_t>("num_ancillae"));

  NegativeEigenvalueTransforms transforms;
  if (problem.settings->get<bool>("negative_evals")) {
    transforms.qft = provider(num_ancillae - 1, false);
    transforms.iqft = provider(num_ancillae - 1, true);
  }
  return std::make_unique<PhaseEstimation>(
      problem.op, provider(num_ancillae, true), std::move(synthesizer),
      *problem.settings, std::move(transforms));
}

}  // namespace qpe::algorithms
