// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace qpe::data {

/**
 * @brief Value of a single setting
 *
 * Integers of every width are stored as int64_t.
 */
using SettingValue = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Inclusive range [min, max] for a numeric setting
 * @tparam T int64_t or double
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();
  T max = std::numeric_limits<T>::max();
};

/**
 * @brief Closed set of allowed values for a setting
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;
};

using Constraint =
    std::variant<BoundConstraint<int64_t>, BoundConstraint<double>,
                 ListConstraint<std::string>>;

/**
 * @brief Integral types other than bool
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T>
concept SettingType = is_variant_member_impl<T, SettingValue>::value;

/**
 * @brief Thrown on modification of locked settings
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Thrown when a key was never declared
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Thrown when a value does not have the declared type of its key
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  SettingTypeMismatch(const std::string& key, const std::string& detail)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "': " + detail) {}
};

/**
 * @brief Typed key/value configuration of an algorithm
 *
 * Derived classes declare every key with set_default() in their constructor.
 * Afterwards only declared keys can be assigned, and only with a value of
 * the declared type that satisfies the declared constraint. An algorithm
 * locks its settings when it takes ownership of them.
 *
 * ```cpp
 * class SolverSettings : public Settings {
 *  public:
 *   SolverSettings() {
 *     set_default("num_time_slices", int64_t(1), "Trotter steps",
 *                 BoundConstraint<int64_t>{1, 1000});
 *   }
 * };
 * ```
 */
class Settings {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Assign a declared setting
   * @throws SettingsAreLocked if lock() was called
   * @throws SettingNotFound if @p key was not declared
   * @throws SettingTypeMismatch if the value type differs from the default
   * @throws std::invalid_argument if the value violates the constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Assign an integer setting from any non-bool integral type
   * @throws std::out_of_range if the value does not fit int64_t
   */
  template <typename Integer>
    requires NonBoolIntegral<Integer> && (!std::same_as<Integer, int64_t>)
  void set(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (value > static_cast<std::make_unsigned_t<int64_t>>(
                      std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' does not fit int64_t");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  void set(const std::string& key, const char* value);

  /**
   * @throws SettingNotFound if @p key was not declared
   * @throws SettingTypeMismatch if the stored value is not a @p T
   */
  template <SettingType T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      throw SettingNotFound(key);
    }
    if (!std::holds_alternative<T>(it->second)) {
      throw SettingTypeMismatch(key, std::string("requested ") +
                                         typeid(T).name());
    }
    return std::get<T>(it->second);
  }

  bool has(const std::string& key) const;

  /**
   * @brief Assign every value of @p other
   *
   * Keys of @p other must be declared here. Either all values are applied or,
   * if one fails validation, none.
   *
   * @throws SettingsAreLocked, SettingNotFound, SettingTypeMismatch,
   * std::invalid_argument as for set()
   */
  void update(const Settings& other);

  void lock() const { _locked = true; }
  bool is_locked() const { return _locked; }

  /// @brief One "key = value" line per setting, with its description
  std::string get_summary() const;

 protected:
  /**
   * @brief Declare a key with its default value
   *
   * Redeclaring a key keeps the first declaration.
   *
   * @throws std::invalid_argument if @p limit does not apply to the type of
   * @p value
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

 private:
  void _check_limit(const std::string& key, const SettingValue& value) const;

  std::map<std::string, SettingValue> values_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  mutable bool _locked = false;
};

}  // namespace qpe::data
