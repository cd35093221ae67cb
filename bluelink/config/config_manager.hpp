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

#pragma once

#include <any>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "bluelink/base/visibility.hpp"

namespace bluelink {
namespace config {

/**
 * Configuration value types supported by the store
 */
enum class ConfigType { String, Integer, Boolean, Double };

/**
 * Configuration validation result
 */
struct ValidationResult {
  bool is_valid;
  std::string error_message;

  explicit ValidationResult(bool valid = true, const std::string& error = "") : is_valid(valid), error_message(error) {}

  static ValidationResult success() { return ValidationResult(true); }
  static ValidationResult error(const std::string& msg) { return ValidationResult(false, msg); }
};

using ConfigValidator = std::function<ValidationResult(const std::any&)>;

/**
 * Configuration item definition
 */
struct ConfigItem {
  std::string key;
  std::any value;
  ConfigType type;
  bool required;
  std::string description;
  ConfigValidator validator;

  ConfigItem() : type(ConfigType::String), required(false) {}

  ConfigItem(const std::string& k, const std::any& v, ConfigType t, bool req = false, const std::string& desc = "")
      : key(k), value(v), type(t), required(req), description(desc) {}
};

/**
 * Invoked after a registered key changes value
 */
using ConfigChangeCallback =
    std::function<void(const std::string& key, const std::any& old_value, const std::any& new_value)>;

/**
 * Thread-safe configuration store
 *
 * Keys set without prior registration take their type from the value. Files use one
 * key=value pair per line; lines starting with '#' are comments.
 */
class BLUELINK_API ConfigManager {
 public:
  ConfigManager() = default;

  /// Throws ConfigurationException for an unknown key.
  std::any get(const std::string& key) const;
  std::any get(const std::string& key, const std::any& default_value) const;
  bool has(const std::string& key) const;

  ValidationResult set(const std::string& key, const std::any& value);
  bool remove(const std::string& key);
  void clear();

  ValidationResult validate() const;
  ValidationResult validate(const std::string& key) const;

  void register_item(const ConfigItem& item);
  void register_validator(const std::string& key, ConfigValidator validator);

  void on_change(const std::string& key, ConfigChangeCallback callback);
  void remove_change_callback(const std::string& key);

  bool save_to_file(const std::string& filepath) const;
  bool load_from_file(const std::string& filepath);

  std::vector<std::string> get_keys() const;
  ConfigType get_type(const std::string& key) const;
  std::string get_description(const std::string& key) const;
  bool is_required(const std::string& key) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ConfigItem> config_items_;
  std::unordered_map<std::string, ConfigChangeCallback> change_callbacks_;

  ValidationResult validate_value(const std::string& key, const std::any& value) const;
  static ConfigType infer_type(const std::any& value);
  static ConfigType infer_type(const std::string& value_str);
  static std::string serialize_value(const std::any& value, ConfigType type);
  static std::any deserialize_value(const std::string& value_str, ConfigType type);
};

}  // namespace config
}  // namespace bluelink
