// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace spinalg::data {

/**
 * @brief Type-safe variant for storing setting values
 *
 * All integer types are stored internally as int64_t. Other integer types can
 * be requested through get() with a range-checked conversion.
 */
using SettingValue = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Inclusive [min, max] bounds for a numeric setting
 * @tparam T The type of the bounded value (int64_t or double)
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();  ///< Minimum allowed value
  T max = std::numeric_limits<T>::max();     ///< Maximum allowed value
};

/**
 * @brief Type for specifying limits on setting values
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, BoundConstraint<double>>;

/**
 * @brief Concept for non-bool integral types
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

/**
 * @brief Concept to check if a type is a member of a std::variant
 */
template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T, typename Variant>
concept VariantMember = is_variant_member_impl<T, Variant>::value;

/**
 * @brief Concept for types supported by the SettingValue variant
 */
template <typename T>
concept SupportedSettingType =
    VariantMember<T, SettingValue> || NonBoolIntegral<T>;

/**
 * @brief Exception thrown when modification of locked settings is requested
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Exception thrown when a setting is not found
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a setting type conversion fails
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Base class for extensible settings objects
 *
 * The set of available keys is fixed by the derived class constructor through
 * the protected set_default() methods. After construction only existing keys
 * can be modified, and only with values of the type they were declared with.
 * Once lock() has been called every mutation throws SettingsAreLocked; copies
 * of a locked object start out unlocked.
 *
 * Usage:
 * ```cpp
 * class MySettings : public Settings {
 *  public:
 *   MySettings() {
 *     set_default("tolerance", 1e-12, "Cutoff for small values",
 *                 BoundConstraint<double>{0.0, 1.0});
 *   }
 * };
 * ```
 */
class Settings {
 public:
  Settings() = default;

  virtual ~Settings() = default;

  /**
   * @brief Copy constructor; the copy is always unlocked
   */
  Settings(const Settings& other);

  Settings(Settings&& other) noexcept = default;

  Settings& operator=(const Settings& other) = delete;

  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Set a setting value
   * @param key The setting key
   * @param value The setting value
   * @throws SettingsAreLocked if lock() has been called
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if the value type differs from the default
   * @throws std::invalid_argument if the value violates the key's bounds
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Set a setting value from any supported type
   *
   * Non-bool integral types are widened to int64_t.
   */
  template <SupportedSettingType T>
    requires(!VariantMember<T, SettingValue>)
  void set(const std::string& key, const T& value) {
    if constexpr (std::is_unsigned_v<T>) {
      if (value > static_cast<T>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  /**
   * @brief Sets a string value from a C-style string.
   */
  void set(const std::string& key, const char* value);

  /**
   * @brief Get a setting value as variant
   * @throws SettingNotFound if key doesn't exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting value with type checking
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if type conversion fails
   */
  template <SupportedSettingType T>
  T get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) {
      throw SettingNotFound(key);
    }

    if constexpr (VariantMember<T, SettingValue>) {
      if (!std::holds_alternative<T>(it->second)) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      return std::get<T>(it->second);
    } else {
      if (!std::holds_alternative<int64_t>(it->second)) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      const int64_t stored = std::get<int64_t>(it->second);
      if (!std::in_range<T>(stored)) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      return static_cast<T>(stored);
    }
  }

  /**
   * @brief Check if a setting exists
   */
  bool has(const std::string& key) const;

  /**
   * @brief Get all setting keys in lexicographic order
   */
  std::vector<std::string> keys() const;

  /**
   * @brief Get the number of settings
   */
  size_t size() const;

  /**
   * @brief Check if settings are empty
   */
  bool empty() const;

  /**
   * @brief Get a setting value as a string representation
   * @throws SettingNotFound if key doesn't exist
   */
  std::string get_as_string(const std::string& key) const;

  /**
   * @brief Get a summary string describing the settings, one line per key
   * followed by its description when it has one
   */
  std::string get_summary() const;

  /**
   * @brief Convert settings to JSON
   * @return JSON object mapping each key to its value
   */
  nlohmann::json to_json() const;

  /**
   * @brief Overwrite existing settings with the values of a JSON object
   *
   * Every key of @p json_obj must already exist. The update is atomic: if
   * any value fails to convert or validate, no setting is modified.
   *
   * @throws std::runtime_error if @p json_obj is not an object or holds an
   *         unsupported value type
   * @throws SettingNotFound, SettingTypeMismatch, std::invalid_argument as
   *         for set()
   */
  void update_from_json(const nlohmann::json& json_obj);

  /**
   * @brief Apply several updates at once
   */
  void update(const std::map<std::string, SettingValue>& updates_map);

  /**
   * @brief Make this object read-only
   */
  void lock() const;

  /**
   * @brief Whether lock() has been called
   */
  bool is_locked() const { return _locked; }

 protected:
  /**
   * @brief Declare a setting and its default value
   *
   * Only meant to be called from derived constructors. Declaring an existing
   * key again is a no-op.
   *
   * @throws std::invalid_argument if @p limit does not match the value type
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  template <NonBoolIntegral T>
    requires(!std::same_as<T, int64_t>)
  void set_default(const std::string& key, T value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt) {
    set_default(key, SettingValue(static_cast<int64_t>(value)),
                std::move(description), std::move(limit));
  }

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt);

 private:
  void validate_limits(const std::string& key, const SettingValue& value) const;

  std::string visit_to_string(const SettingValue& value) const;

  SettingValue convert_json_to_setting_value(const std::string& key,
                                             const nlohmann::json& j) const;

  /// Storage for all settings
  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  /// Flag to indicate if settings are locked
  mutable bool _locked = false;
};

}  // namespace spinalg::data
