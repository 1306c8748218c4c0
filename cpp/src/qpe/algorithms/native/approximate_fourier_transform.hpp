// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <limits>
#include <qpe/algorithms/fourier_transform.hpp>
#include <qpe/data/settings.hpp>

namespace qpe::algorithms::native {

/**
 * @class ApproximateFourierTransformSettings
 * @brief Settings of the degree-truncated Fourier transform
 *
 * Default settings include:
 * - num_qubits: 1 - Number of qubits the transform acts on
 * - degree: 0 - Maximum qubit distance of retained controlled phases
 * - inverse: true - Build the inverse transform
 *
 * The owning transform fills in the values and locks the settings on
 * construction.
 */
class ApproximateFourierTransformSettings : public data::Settings {
 public:
  ApproximateFourierTransformSettings() : data::Settings() {
    set_default("num_qubits", int64_t(1), "Number of qubits",
                data::BoundConstraint<int64_t>{
                    1, std::numeric_limits<int64_t>::max()});
    set_default("degree", int64_t(0),
                "Maximum qubit distance of retained controlled-phase gates",
                data::BoundConstraint<int64_t>{
                    0, std::numeric_limits<int64_t>::max()});
    set_default("inverse", true, "Build the inverse transform");
  }
};

/**
 * @class ApproximateFourierTransform
 * @brief Fourier transform with controlled phases truncated by qubit distance
 *
 * The inverse circuit visits qubits from most to least significant. Each
 * qubit j receives a Hadamard followed by controlled phases of angle
 * -pi / 2^(j - k) towards every lower qubit k with j - k <= degree, in
 * descending k. The forward circuit is the exact adjoint of that sequence.
 */
class ApproximateFourierTransform : public FourierTransform {
 public:
  ApproximateFourierTransform(std::size_t num_qubits, std::size_t degree,
                              bool inverse);

  ~ApproximateFourierTransform() override = default;

  std::string name() const final { return "approximate"; }

  std::size_t num_qubits() const override { return num_qubits_; }
  bool is_inverse() const override { return inverse_; }
  std::size_t degree() const { return degree_; }

  Eigen::MatrixXcd matrix() const override;

 protected:
  void _append_gates(data::Circuit& circuit,
                     const std::vector<data::Qubit>& qubits) const override;

 private:
  std::size_t num_qubits_;
  std::size_t degree_;
  bool inverse_;
};

}  // namespace qpe::algorithms::native
