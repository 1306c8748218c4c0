// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <qpe/utils/logger.hpp>

namespace qpe::utils {

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::shared_ptr<spdlog::logger> logger = []() {
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    auto created = spdlog::stdout_color_mt(name);
    created->set_level(spdlog::level::info);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    // Environment overrides are applied to registered loggers only
    spdlog::cfg::load_env_levels();
    return created;
  }();
  return logger;
}

void Logger::set_level(spdlog::level::level_enum level) {
  get()->set_level(level);
}

}  // namespace qpe::utils
