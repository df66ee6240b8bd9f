// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <sstream>
#include <spinalg/data/settings.hpp>

namespace spinalg::data {

Settings::Settings(const Settings& other)
    : settings_(other.settings_),
      descriptions_(other.descriptions_),
      limits_(other.limits_),
      _locked(false) {}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }

  // Check if types match
  if (value.index() != it->second.index()) {
    throw SettingTypeMismatch(key, "does not match type of given argument");
  }

  validate_limits(key, value);
  it->second = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

void Settings::validate_limits(const std::string& key,
                               const SettingValue& value) const {
  auto limit_it = limits_.find(key);
  if (limit_it == limits_.end()) {
    return;
  }

  if (std::holds_alternative<int64_t>(value) &&
      std::holds_alternative<BoundConstraint<int64_t>>(limit_it->second)) {
    const auto& bounds = std::get<BoundConstraint<int64_t>>(limit_it->second);
    const int64_t v = std::get<int64_t>(value);
    if (bounds.min > v || v > bounds.max) {
      throw std::invalid_argument(
          "Value for setting '" + key +
          "' is out of allowed range. Allowed range: [" +
          std::to_string(bounds.min) + ", " + std::to_string(bounds.max) +
          "]");
    }
  } else if (std::holds_alternative<double>(value) &&
             std::holds_alternative<BoundConstraint<double>>(
                 limit_it->second)) {
    const auto& bounds = std::get<BoundConstraint<double>>(limit_it->second);
    const double v = std::get<double>(value);
    if (bounds.min > v || v > bounds.max) {
      throw std::invalid_argument(
          "Value for setting '" + key +
          "' is out of allowed range. Allowed range: [" +
          std::to_string(bounds.min) + ", " + std::to_string(bounds.max) +
          "]");
    }
  }
}

SettingValue Settings::get(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";

  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }

  oss << "  Settings:\n";
  for (const auto& [key, value] : settings_) {
    oss << "    " << key << " = " << visit_to_string(value);
    if (auto it = descriptions_.find(key); it != descriptions_.end()) {
      oss << "  (" << it->second << ")";
    }
    oss << "\n";
  }

  return oss.str();
}

std::string Settings::get_as_string(const std::string& key) const {
  return visit_to_string(get(key));
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj = nlohmann::json::object();
  for (const auto& [key, value] : settings_) {
    std::visit([&json_obj, &key](const auto& v) { json_obj[key] = v; }, value);
  }
  return json_obj;
}

void Settings::update_from_json(const nlohmann::json& json_obj) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }

  std::map<std::string, SettingValue> converted_updates;
  for (const auto& [key, value] : json_obj.items()) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
    converted_updates[key] = convert_json_to_setting_value(key, value);
  }
  update(converted_updates);
}

void Settings::update(const std::map<std::string, SettingValue>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }

  // Validate everything before touching the stored values
  for (const auto& [key, value] : updates_map) {
    auto it = settings_.find(key);
    if (it == settings_.end()) {
      throw SettingNotFound(key);
    }
    if (value.index() != it->second.index()) {
      throw SettingTypeMismatch(key, "does not match type of given argument");
    }
    validate_limits(key, value);
  }
  for (const auto& [key, value] : updates_map) {
    settings_[key] = value;
  }
}

void Settings::lock() const { _locked = true; }

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit.has_value()) {
    const bool int_limit =
        std::holds_alternative<BoundConstraint<int64_t>>(*limit);
    const bool double_limit =
        std::holds_alternative<BoundConstraint<double>>(*limit);
    if (!(std::holds_alternative<int64_t>(value) && int_limit) &&
        !(std::holds_alternative<double>(value) && double_limit)) {
      throw std::invalid_argument(
          "Type of settings values and limits must match for setting '" +
          key + "'");
    }
  }

  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = *description;
  }
  if (limit.has_value()) {
    limits_[key] = *limit;
    validate_limits(key, value);
  }
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description) {
  set_default(key, SettingValue(std::string(value)), std::move(description));
}

std::string Settings::visit_to_string(const SettingValue& value) const {
  return std::visit(
      [](const auto& variant_value) -> std::string {
        using ValueType = std::decay_t<decltype(variant_value)>;

        if constexpr (std::is_same_v<ValueType, bool>) {
          return variant_value ? "true" : "false";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return variant_value;
        } else if constexpr (std::is_floating_point_v<ValueType>) {
          // Use scientific notation to avoid truncation of small values
          std::ostringstream oss;
          oss << std::scientific << variant_value;
          return oss.str();
        } else {
          return std::to_string(variant_value);
        }
      },
      value);
}

SettingValue Settings::convert_json_to_setting_value(
    const std::string& key, const nlohmann::json& json_obj) const {
  const auto& current = settings_.at(key);
  if (json_obj.is_boolean()) {
    return json_obj.get<bool>();
  } else if (json_obj.is_number_integer()) {
    // Integers are accepted for floating point settings
    if (std::holds_alternative<double>(current)) {
      return json_obj.get<double>();
    }
    return json_obj.get<int64_t>();
  } else if (json_obj.is_number_float()) {
    return json_obj.get<double>();
  } else if (json_obj.is_string()) {
    return json_obj.get<std::string>();
  }
  throw std::runtime_error("Unsupported JSON type for setting '" + key + "'");
}

}  // namespace spinalg::data
