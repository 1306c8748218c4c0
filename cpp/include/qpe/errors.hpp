// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <stdexcept>
#include <string>

namespace qpe {

/**
 * @brief Exception thrown when a builder is configured inconsistently
 *
 * Raised for missing operators, missing or mis-sized sub-components,
 * unrecognized mode strings, ambiguous identity terms and degenerate
 * spectral bounds.
 */
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message)
      : std::invalid_argument("Configuration error: " + message) {}
};

/**
 * @brief Exception thrown when a recognized but unavailable mode of
 * operation is requested
 */
class UnsupportedOperationError : public std::logic_error {
 public:
  explicit UnsupportedOperationError(const std::string& message)
      : std::logic_error("Unsupported operation: " + message) {}
};

}  // namespace qpe
