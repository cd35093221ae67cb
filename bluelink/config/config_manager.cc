/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "bluelink/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

#include "bluelink/base/exceptions.hpp"
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace config {

namespace {

struct PendingChange {
  std::string key;
  std::any old_value;
  std::any new_value;
  ConfigChangeCallback callback;
};

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

// Callbacks run without the store lock so they may read the configuration
void dispatch(std::vector<PendingChange>& changes) {
  for (auto& change : changes) {
    try {
      change.callback(change.key, change.old_value, change.new_value);
    } catch (const std::exception& e) {
      BLUELINK_LOG_ERROR("config", "notify_change", "Callback for '" + change.key + "' threw: " + e.what());
      diagnostics::error_reporting::report_system_error("config", "notify_change",
                                                        "Exception in change callback: " + std::string(e.what()));
    }
  }
}

}  // namespace

std::any ConfigManager::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.value;
  }
  throw ConfigurationException("Configuration key not found: " + key, key, "get");
}

std::any ConfigManager::get(const std::string& key, const std::any& default_value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.value;
  }
  return default_value;
}

bool ConfigManager::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.find(key) != config_items_.end();
}

ValidationResult ConfigManager::set(const std::string& key, const std::any& value) {
  std::vector<PendingChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = validate_value(key, value);
    if (!result.is_valid) {
      BLUELINK_LOG_WARNING("config", "set", result.error_message);
      return result;
    }

    auto it = config_items_.find(key);
    if (it == config_items_.end()) {
      config_items_[key] = ConfigItem(key, value, infer_type(value));
      return ValidationResult::success();
    }

    std::any old_value = it->second.value;
    it->second.value = value;
    auto cb = change_callbacks_.find(key);
    if (cb != change_callbacks_.end()) {
      changes.push_back(PendingChange{key, std::move(old_value), value, cb->second});
    }
  }
  dispatch(changes);
  return ValidationResult::success();
}

bool ConfigManager::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.erase(key) > 0;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_.clear();
}

ValidationResult ConfigManager::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [key, item] : config_items_) {
    if (item.required && !item.value.has_value()) {
      return ValidationResult::error("Required key missing value: " + key);
    }
    auto result = validate_value(key, item.value);
    if (!result.is_valid) {
      return result;
    }
  }
  return ValidationResult::success();
}

ValidationResult ConfigManager::validate(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::error("Configuration key not found: " + key);
  }
  return validate_value(key, it->second.value);
}

void ConfigManager::register_item(const ConfigItem& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_[item.key] = item;
}

void ConfigManager::register_validator(const std::string& key, ConfigValidator validator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    it->second.validator = std::move(validator);
  }
}

void ConfigManager::on_change(const std::string& key, ConfigChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_[key] = std::move(callback);
}

void ConfigManager::remove_change_callback(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_.erase(key);
}

bool ConfigManager::save_to_file(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream file(filepath);
  if (!file.is_open()) {
    BLUELINK_LOG_ERROR("config", "save", "Cannot open " + filepath);
    diagnostics::error_reporting::report_configuration_error("config", "save", "Cannot open " + filepath);
    return false;
  }

  // Sorted so saved files diff cleanly
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }
  std::sort(keys.begin(), keys.end());

  file << "# bluelink configuration file\n\n";
  for (const auto& key : keys) {
    const auto& item = config_items_.at(key);
    if (!item.description.empty()) {
      file << "# " << item.description << "\n";
    }
    file << key << "=" << serialize_value(item.value, item.type) << "\n";
  }
  return static_cast<bool>(file);
}

bool ConfigManager::load_from_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    BLUELINK_LOG_WARNING("config", "load", "Cannot open " + filepath);
    return false;
  }

  std::vector<PendingChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
      ++line_no;
      line = trim(line);
      if (line.empty() || line[0] == '#') {
        continue;
      }

      const size_t pos = line.find('=');
      if (pos == std::string::npos) {
        BLUELINK_LOG_WARNING("config", "load", filepath + ":" + std::to_string(line_no) + ": missing '='");
        continue;
      }
      const std::string key = trim(line.substr(0, pos));
      const std::string value_str = trim(line.substr(pos + 1));

      auto it = config_items_.find(key);
      if (it == config_items_.end()) {
        const ConfigType type = infer_type(value_str);
        config_items_[key] = ConfigItem(key, deserialize_value(value_str, type), type);
        continue;
      }

      // Registered keys keep their declared type
      std::any value = deserialize_value(value_str, it->second.type);
      auto result = validate_value(key, value);
      if (!result.is_valid) {
        BLUELINK_LOG_WARNING("config", "load", filepath + ":" + std::to_string(line_no) + ": " + result.error_message);
        diagnostics::error_reporting::report_configuration_error("config", "load", result.error_message);
        continue;
      }
      std::any old_value = std::exchange(it->second.value, value);
      auto cb = change_callbacks_.find(key);
      if (cb != change_callbacks_.end()) {
        changes.push_back(PendingChange{key, std::move(old_value), std::move(value), cb->second});
      }
    }
  }
  dispatch(changes);
  return true;
}

std::vector<std::string> ConfigManager::get_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }
  return keys;
}

ConfigType ConfigManager::get_type(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.type;
  }
  throw ConfigurationException("Configuration key not found: " + key, key, "get_type");
}

std::string ConfigManager::get_description(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() ? it->second.description : std::string();
}

bool ConfigManager::is_required(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() && it->second.required;
}

ValidationResult ConfigManager::validate_value(const std::string& key, const std::any& value) const {
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::success();
  }
  if (infer_type(value) != it->second.type) {
    return ValidationResult::error("Type mismatch for key '" + key + "'");
  }
  if (it->second.validator) {
    return it->second.validator(value);
  }
  return ValidationResult::success();
}

ConfigType ConfigManager::infer_type(const std::any& value) {
  if (value.type() == typeid(int)) {
    return ConfigType::Integer;
  }
  if (value.type() == typeid(bool)) {
    return ConfigType::Boolean;
  }
  if (value.type() == typeid(double)) {
    return ConfigType::Double;
  }
  return ConfigType::String;
}

ConfigType ConfigManager::infer_type(const std::string& value_str) {
  if (value_str == "true" || value_str == "false") {
    return ConfigType::Boolean;
  }
  if (value_str.empty()) {
    return ConfigType::String;
  }

  size_t digits = 0;
  size_t dots = 0;
  for (size_t i = 0; i < value_str.size(); ++i) {
    const char c = value_str[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      ++digits;
    } else if (c == '.') {
      ++dots;
    } else if (!(c == '-' && i == 0)) {
      return ConfigType::String;
    }
  }
  if (digits == 0 || dots > 1) {
    return ConfigType::String;
  }
  return dots == 1 ? ConfigType::Double : ConfigType::Integer;
}

std::string ConfigManager::serialize_value(const std::any& value, ConfigType type) {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any_cast<std::string>(value);
      case ConfigType::Integer:
        return std::to_string(std::any_cast<int>(value));
      case ConfigType::Boolean:
        return std::any_cast<bool>(value) ? "true" : "false";
      case ConfigType::Double:
        return std::to_string(std::any_cast<double>(value));
    }
  } catch (const std::bad_any_cast&) {
    BLUELINK_LOG_WARNING("config", "save", "Value does not match its declared type");
  }
  return std::string();
}

std::any ConfigManager::deserialize_value(const std::string& value_str, ConfigType type) {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any(value_str);
      case ConfigType::Integer:
        return std::any(std::stoi(value_str));
      case ConfigType::Boolean:
        return std::any(value_str == "true");
      case ConfigType::Double:
        return std::any(std::stod(value_str));
    }
  } catch (const std::exception& e) {
    BLUELINK_LOG_DEBUG("config", "load", "Keeping '" + value_str + "' as text: " + e.what());
  }
  return std::any(value_str);
}

}  // namespace config
}  // namespace bluelink
