// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <qpe/data/settings.hpp>
#include <qpe/utils/logger.hpp>
#include <sstream>

namespace qpe::data {

namespace {

std::string format_value(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "\"" + v + "\"";
        } else {
          std::ostringstream oss;
          oss << v;
          return oss.str();
        }
      },
      value);
}

template <typename T>
void check_bound(const std::string& key, const BoundConstraint<T>& bound,
                 T value) {
  if (value < bound.min || value > bound.max) {
    std::ostringstream oss;
    oss << "Value " << value << " for setting '" << key
        << "' is outside the allowed range [" << bound.min << ", "
        << bound.max << "]";
    throw std::invalid_argument(oss.str());
  }
}

void check_option(const std::string& key,
                  const ListConstraint<std::string>& options,
                  const std::string& value) {
  const auto& allowed = options.allowed_values;
  if (std::find(allowed.begin(), allowed.end(), value) != allowed.end()) {
    return;
  }
  std::string message = "Value \"" + value + "\" for setting '" + key +
                        "' is not one of:";
  for (const auto& option : allowed) {
    message += " \"" + option + "\"";
  }
  throw std::invalid_argument(message);
}

}  // namespace

void Settings::_check_limit(const std::string& key,
                            const SettingValue& value) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    return;
  }
  const auto& limit = it->second;
  if (auto* bound = std::get_if<BoundConstraint<int64_t>>(&limit)) {
    check_bound(key, *bound, std::get<int64_t>(value));
  } else if (auto* bound = std::get_if<BoundConstraint<double>>(&limit)) {
    check_bound(key, *bound, std::get<double>(value));
  } else {
    check_option(key, std::get<ListConstraint<std::string>>(limit),
                 std::get<std::string>(value));
  }
}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  auto it = values_.find(key);
  if (it == values_.end()) {
    throw SettingNotFound(key);
  }
  if (value.index() != it->second.index()) {
    throw SettingTypeMismatch(key, "value type differs from the default");
  }
  _check_limit(key, value);
  it->second = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

bool Settings::has(const std::string& key) const {
  return values_.find(key) != values_.end();
}

void Settings::update(const Settings& other) {
  QPE_LOG_TRACE_ENTERING();
  if (_locked) {
    throw SettingsAreLocked();
  }
  Settings staged(*this);
  for (const auto& [key, value] : other.values_) {
    staged.set(key, value);
  }
  values_ = std::move(staged.values_);
}

std::string Settings::get_summary() const {
  std::ostringstream oss;
  for (const auto& [key, value] : values_) {
    oss << key << " = " << format_value(value);
    if (auto it = descriptions_.find(key); it != descriptions_.end()) {
      oss << "  # " << it->second;
    }
    oss << "\n";
  }
  return oss.str();
}

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit) {
    const bool applies =
        (std::holds_alternative<int64_t>(value) &&
         std::holds_alternative<BoundConstraint<int64_t>>(*limit)) ||
        (std::holds_alternative<double>(value) &&
         std::holds_alternative<BoundConstraint<double>>(*limit)) ||
        (std::holds_alternative<std::string>(value) &&
         std::holds_alternative<ListConstraint<std::string>>(*limit));
    if (!applies) {
      throw std::invalid_argument("Constraint of setting '" + key +
                                  "' does not apply to its value type");
    }
    limits_[key] = *limit;
  }
  values_[key] = value;
  if (description) {
    descriptions_[key] = *description;
  }
}

}  // namespace qpe::data
