// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace qpe::utils {

/**
 * @brief Access point for the library-wide spdlog logger
 *
 * The logger is named "qpe" and is created on first use with a colored
 * stdout sink. Its level defaults to info and may be overridden through the
 * SPDLOG_LEVEL environment variable (e.g. SPDLOG_LEVEL=qpe=debug).
 */
class Logger {
 public:
  /// Name under which the logger is registered with spdlog
  static constexpr const char* name = "qpe";

  /**
   * @brief Get the library logger, creating it if necessary
   * @return Shared pointer to the spdlog logger
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the level of the library logger
   * @param level New logging level
   */
  static void set_level(spdlog::level::level_enum level);
};

}  // namespace qpe::utils

/// @brief Reference to the library logger
#define QPE_LOGGER() (*qpe::utils::Logger::get())

/// @brief Trace-level log message marking entry into the current function
#define QPE_LOG_TRACE_ENTERING() QPE_LOGGER().trace("Entering {}", __func__)
