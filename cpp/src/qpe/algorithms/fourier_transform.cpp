// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/errors.hpp>
#include <qpe/utils/logger.hpp>

#include "native/approximate_fourier_transform.hpp"

namespace qpe::algorithms {

void FourierTransform::append(data::Circuit& circuit,
                              const std::vector<data::Qubit>& qubits) const {
  QPE_LOG_TRACE_ENTERING();
  if (qubits.size() != num_qubits()) {
    throw std::invalid_argument(
        "Fourier transform on " + std::to_string(num_qubits()) +
        " qubits cannot act on " + std::to_string(qubits.size()) + " qubits");
  }
  _append_gates(circuit, qubits);
}

std::shared_ptr<data::Circuit> FourierTransform::_run_impl(
    std::shared_ptr<data::Circuit> circuit,
    const std::vector<data::Qubit>& qubits) const {
  QPE_LOG_TRACE_ENTERING();
  if (!circuit) {
    if (qubits.empty()) {
      data::QuantumRegister reg("q", num_qubits());
      circuit = std::make_shared<data::Circuit>(
          std::vector<data::QuantumRegister>{reg});
      append(*circuit, reg.qubits());
      return circuit;
    }
    // Build the registers the supplied qubits refer to
    circuit = std::make_shared<data::Circuit>();
    std::vector<std::pair<std::string, std::size_t>> sizes;
    for (const auto& qubit : qubits) {
      auto it = std::find_if(
          sizes.begin(), sizes.end(),
          [&qubit](const auto& entry) {
            return entry.first == qubit.register_name;
          });
      if (it == sizes.end()) {
        sizes.emplace_back(qubit.register_name, qubit.index + 1);
      } else {
        it->second = std::max(it->second, qubit.index + 1);
      }
    }
    for (const auto& [name, size] : sizes) {
      circuit->add_register(data::QuantumRegister(name, size));
    }
  }
  append(*circuit, qubits);
  return circuit;
}

FourierTransform::Construction FourierTransform::construct_circuit(
    const std::string& mode, const std::vector<data::Qubit>& qubits,
    std::shared_ptr<data::Circuit> circuit) const {
  QPE_LOG_TRACE_ENTERING();
  if (mode == "vector") {
    return matrix();
  } else if (mode == "circuit") {
    return run(std::move(circuit), qubits);
  }
  throw ConfigurationError("Mode should be either \"vector\" or \"circuit\", "
                           "got \"" +
                           mode + "\"");
}

std::unique_ptr<FourierTransform> make_approximate_fourier_transform(
    std::size_t num_qubits, std::size_t degree, bool inverse) {
  return std::make_unique<native::ApproximateFourierTransform>(num_qubits,
                                                               degree, inverse);
}

FourierTransformProvider make_approximate_fourier_transform_provider(
    std::size_t degree) {
  return [degree](std::size_t num_qubits,
                  bool inverse) -> std::shared_ptr<const FourierTransform> {
    return make_approximate_fourier_transform(
        num_qubits, std::min(degree, num_qubits), inverse);
  };
}

}  // namespace qpe::algorithms
