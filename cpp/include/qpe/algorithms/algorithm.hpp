// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <memory>
#include <string>
#include <utility>

#include "qpe/data/settings.hpp"

namespace qpe::algorithms {

/**
 * @brief Base class for algorithms
 *
 * This class automatically generates a run() method that locks settings
 * and delegates to _run_impl(). Sub-components are passed to algorithms
 * explicitly; there is no lookup by name.
 *
 * @tparam Derived The derived algorithm class such as FourierTransform
 * @tparam ReturnType The return type of the algorithm's run() and _run_impl()
 * methods
 * @tparam Args Parameter pack containing the types of input arguments required
 * by the algorithm
 *
 * Usage:
 * @code
 * class PhaseEstimation
 *     : public Algorithm<PhaseEstimation,
 *                        std::shared_ptr<data::CircuitBuildResult>,
 *                        const data::QuantumRegister&> {
 *  protected:
 *   std::shared_ptr<data::CircuitBuildResult> _run_impl(
 *       const data::QuantumRegister& state) const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Auto-generated run() method
   *
   * Automatically locks settings and delegates to _run_impl()
   *
   * @param args Arguments forwarded to _run_impl() - types specified by the
   * Args parameter pack
   * @return ReturnType The result from executing _run_impl()
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /**
   * @brief Access the algorithm's settings
   *
   * @return Reference to the algorithm's Settings object
   */
  data::Settings& settings() { return *_settings; }

  /// @brief Read-only access to the algorithm's settings
  const data::Settings& settings() const { return *_settings; }

  /**
   * @brief Access the algorithm's name
   *
   * @return The algorithm's name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Access the algorithm's type name
   *
   * @return The algorithm's type name
   */
  virtual std::string type_name() const = 0;

 protected:
  /**
   * @brief Lock settings before execution
   */
  void lock_settings() const { this->_settings->lock(); }

  /**
   * @brief Implementation method that derived classes must override
   *
   * @param args Input arguments - types specified by the Args parameter pack
   * @return ReturnType The computed result of the algorithm
   */
  virtual ReturnType _run_impl(Args... args) const = 0;

  /**
   * @brief The algorithm's settings, to be replaced by derived classes
   */
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

}  // namespace qpe::algorithms
