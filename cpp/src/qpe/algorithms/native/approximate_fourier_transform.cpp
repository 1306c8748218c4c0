// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "approximate_fourier_transform.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>
#include <qpe/utils/logger.hpp>

namespace qpe::algorithms::native {

ApproximateFourierTransform::ApproximateFourierTransform(std::size_t num_qubits,
                                                         std::size_t degree,
                                                         bool inverse)
    : num_qubits_(num_qubits), degree_(degree), inverse_(inverse) {
  QPE_LOG_TRACE_ENTERING();
  _settings = std::make_unique<ApproximateFourierTransformSettings>();
  _settings->set("num_qubits", num_qubits);
  _settings->set("degree", degree);
  _settings->set("inverse", inverse);
  _settings->lock();
}

Eigen::MatrixXcd ApproximateFourierTransform::matrix() const {
  QPE_LOG_TRACE_ENTERING();
  const Eigen::Index dim = Eigen::Index{1} << num_qubits_;
  const double norm = 1.0 / std::sqrt(static_cast<double>(dim));
  const double sign = inverse_ ? -1.0 : 1.0;

  Eigen::MatrixXcd dft(dim, dim);
  for (Eigen::Index j = 0; j < dim; ++j) {
    for (Eigen::Index k = 0; k < dim; ++k) {
      // Reduce j*k mod N before forming the angle to keep it exact
      const auto jk = (j * k) % dim;
      const double angle = sign * 2.0 * std::numbers::pi *
                           static_cast<double>(jk) / static_cast<double>(dim);
      dft(j, k) = std::polar(norm, angle);
    }
  }
  return dft;
}

void ApproximateFourierTransform::_append_gates(
    data::Circuit& circuit, const std::vector<data::Qubit>& qubits) const {
  QPE_LOG_TRACE_ENTERING();
  const std::size_t n = num_qubits_;
  auto window_start = [this](std::size_t j) {
    return j > degree_ ? j - degree_ : std::size_t{0};
  };
  auto phase = [](std::size_t distance) {
    return std::numbers::pi / std::ldexp(1.0, static_cast<int>(distance));
  };

  if (inverse_) {
    for (std::size_t j = n; j-- > 0;) {
      circuit.h(qubits[j]);
      for (std::size_t k = j; k-- > window_start(j);) {
        circuit.cu1(-phase(j - k), qubits[j], qubits[k]);
      }
    }
  } else {
    for (std::size_t j = 0; j < n; ++j) {
      for (std::size_t k = window_start(j); k < j; ++k) {
        circuit.cu1(phase(j - k), qubits[j], qubits[k]);
      }
      circuit.h(qubits[j]);
    }
  }

  QPE_LOGGER().debug("{} Fourier transform on {} qubits (degree {}): {} gates",
                     inverse_ ? "Inverse" : "Forward", n, degree_,
                     circuit.num_gates());
}

}  // namespace qpe::algorithms::native
