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

#include "bluelink/config/config_factory.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "bluelink/base/constants.hpp"
#include "bluelink/config/config_manager.hpp"
#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace config {

using namespace base::constants;
using diagnostics::LogLevel;
using diagnostics::Logger;

namespace {

template <typename T>
T value_or(const ConfigManager& config, const std::string& key, T fallback) {
  std::any value = config.get(key, std::any());
  if (!value.has_value()) {
    return fallback;
  }
  if (const T* typed = std::any_cast<T>(&value)) {
    return *typed;
  }
  BLUELINK_LOG_WARNING("config", "read", "Ignoring '" + key + "' with unexpected type");
  return fallback;
}

ConfigValidator int_range(int min_value, int max_value) {
  return [min_value, max_value](const std::any& value) {
    const int v = std::any_cast<int>(value);
    if (v < min_value || v > max_value) {
      return ValidationResult::error("Value " + std::to_string(v) + " outside [" + std::to_string(min_value) + ", " +
                                     std::to_string(max_value) + "]");
    }
    return ValidationResult::success();
  };
}

std::optional<LogLevel> parse_level(const std::string& name) {
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warning") return LogLevel::WARNING;
  if (name == "error") return LogLevel::ERROR;
  if (name == "critical") return LogLevel::CRITICAL;
  return std::nullopt;
}

void register_key(const std::shared_ptr<ConfigManager>& config, const std::string& key, std::any value,
                  ConfigType type, const std::string& description, ConfigValidator validator = nullptr) {
  ConfigItem item(key, std::move(value), type, false, description);
  item.validator = std::move(validator);
  config->register_item(item);
}

}  // namespace

namespace delimiter_format {

std::optional<std::vector<uint8_t>> parse(const std::string& text) {
  std::vector<uint8_t> out;
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    const auto first = token.find_first_not_of(" \t");
    const auto last = token.find_last_not_of(" \t");
    if (first == std::string::npos) {
      return std::nullopt;
    }
    token = token.substr(first, last - first + 1);
    if (token.size() > 2 || !std::isxdigit(static_cast<unsigned char>(token[0])) ||
        (token.size() == 2 && !std::isxdigit(static_cast<unsigned char>(token[1])))) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>(std::strtoul(token.c_str(), nullptr, 16)));
  }
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

std::string format(const std::vector<uint8_t>& delimiters) {
  std::string out;
  char buf[3];
  for (uint8_t b : delimiters) {
    if (!out.empty()) out += ',';
    std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(b));
    out += buf;
  }
  return out;
}

}  // namespace delimiter_format

std::shared_ptr<ConfigManager> ConfigFactory::create() { return std::make_shared<ConfigManager>(); }

std::shared_ptr<ConfigManager> ConfigFactory::create_with_defaults() {
  auto config = create();
  ConfigPresets::setup_all_defaults(config);
  return config;
}

std::shared_ptr<ConfigManager> ConfigFactory::create_from_file(const std::string& filepath) {
  auto config = create_with_defaults();
  if (!config->load_from_file(filepath)) {
    BLUELINK_LOG_INFO("config", "load", "Using defaults, could not read " + filepath);
  }
  return config;
}

MultiplexerConfig ConfigFactory::make_multiplexer_config(const ConfigManager& config) {
  MultiplexerConfig cfg;
  const auto delimiters = value_or<std::string>(config, "multiplexer.delimiters", std::string());
  if (!delimiters.empty()) {
    if (auto parsed = delimiter_format::parse(delimiters)) {
      cfg.delimiters = *parsed;
    } else {
      BLUELINK_LOG_WARNING("config", "multiplexer", "Ignoring malformed delimiters '" + delimiters + "'");
    }
  }
  const int max_text = value_or<int>(config, "multiplexer.max_text_length", static_cast<int>(cfg.max_text_length));
  cfg.max_text_length = max_text < 0 ? 0 : static_cast<size_t>(max_text);
  const int threshold =
      value_or<int>(config, "multiplexer.backpressure_threshold", static_cast<int>(cfg.backpressure_threshold));
  cfg.backpressure_threshold = threshold < 0 ? 0 : static_cast<size_t>(threshold);
  cfg.validate_and_clamp();
  return cfg;
}

ConnectionConfig ConfigFactory::make_connection_config(const ConfigManager& config) {
  ConnectionConfig cfg;
  cfg.service_name = value_or<std::string>(config, "connection.service_name", cfg.service_name);
  cfg.service_uuid = value_or<std::string>(config, "connection.service_uuid", cfg.service_uuid);
  cfg.auto_listen = value_or<bool>(config, "connection.auto_listen", cfg.auto_listen);
  cfg.relisten_after_disconnect =
      value_or<bool>(config, "connection.relisten_after_disconnect", cfg.relisten_after_disconnect);
  cfg.listen_max_retries = value_or<int>(config, "connection.listen_max_retries", cfg.listen_max_retries);
  const int interval = value_or<int>(config, "connection.listen_retry_interval_ms",
                                     static_cast<int>(cfg.listen_retry_interval_ms));
  cfg.listen_retry_interval_ms = interval < 0 ? 0u : static_cast<unsigned>(interval);
  cfg.multiplexer = make_multiplexer_config(config);
  cfg.validate_and_clamp();
  return cfg;
}

void ConfigFactory::apply_logging_config(const ConfigManager& config) {
  auto& logger = Logger::instance();
  const auto level_name = value_or<std::string>(config, "logging.level", std::string("info"));
  if (auto level = parse_level(level_name)) {
    logger.set_level(*level);
  } else {
    BLUELINK_LOG_WARNING("config", "logging", "Unknown log level '" + level_name + "'");
  }
  logger.set_console_output(value_or<bool>(config, "logging.enable_console", true));
  logger.set_file_output(value_or<std::string>(config, "logging.file_path", std::string()));
}

void ConfigPresets::setup_connection_defaults(const std::shared_ptr<ConfigManager>& config) {
  register_key(config, "connection.service_name", std::string(DEFAULT_SERVICE_NAME), ConfigType::String,
               "Service record name advertised while listening", [](const std::any& value) {
                 const auto& name = std::any_cast<const std::string&>(value);
                 if (name.empty() || name.size() > MAX_SERVICE_NAME_LENGTH) {
                   return ValidationResult::error("Service name must be 1.." +
                                                  std::to_string(MAX_SERVICE_NAME_LENGTH) + " bytes");
                 }
                 return ValidationResult::success();
               });
  register_key(config, "connection.service_uuid", std::string(SERIAL_PORT_SERVICE_UUID), ConfigType::String,
               "Service UUID for listening and connecting");
  register_key(config, "connection.auto_listen", true, ConfigType::Boolean,
               "Listen whenever the radio is on and nothing is connected");
  register_key(config, "connection.relisten_after_disconnect", true, ConfigType::Boolean,
               "Listen again after an explicit disconnect");
  register_key(config, "connection.listen_max_retries", DEFAULT_LISTEN_MAX_RETRIES, ConfigType::Integer,
               "Retries after a failed listen, -1 for unlimited", int_range(-1, MAX_RETRIES_LIMIT));
  register_key(config, "connection.listen_retry_interval_ms", static_cast<int>(DEFAULT_RETRY_INTERVAL_MS),
               ConfigType::Integer, "Delay between listen retries",
               int_range(static_cast<int>(MIN_RETRY_INTERVAL_MS), static_cast<int>(MAX_RETRY_INTERVAL_MS)));
}

void ConfigPresets::setup_multiplexer_defaults(const std::shared_ptr<ConfigManager>& config) {
  register_key(config, "multiplexer.delimiters", delimiter_format::format({CARRIAGE_RETURN, LINE_FEED}),
               ConfigType::String, "Text stream delimiter bytes in hex", [](const std::any& value) {
                 if (!delimiter_format::parse(std::any_cast<const std::string&>(value))) {
                   return ValidationResult::error("Delimiters must be comma separated hex bytes");
                 }
                 return ValidationResult::success();
               });
  register_key(config, "multiplexer.max_text_length", static_cast<int>(DEFAULT_MAX_TEXT_LENGTH), ConfigType::Integer,
               "Longest text segment before it is discarded, 0 for unbounded",
               int_range(0, static_cast<int>(MAX_TEXT_LENGTH_LIMIT)));
  register_key(config, "multiplexer.backpressure_threshold", static_cast<int>(DEFAULT_BACKPRESSURE_THRESHOLD),
               ConfigType::Integer, "Pending notifications per subscriber before a warning",
               int_range(static_cast<int>(MIN_BACKPRESSURE_THRESHOLD), static_cast<int>(MAX_BACKPRESSURE_THRESHOLD)));
}

void ConfigPresets::setup_logging_defaults(const std::shared_ptr<ConfigManager>& config) {
  register_key(config, "logging.level", std::string("info"), ConfigType::String, "debug, info, warning, error or critical",
               [](const std::any& value) {
                 if (!parse_level(std::any_cast<const std::string&>(value))) {
                   return ValidationResult::error("Unknown log level");
                 }
                 return ValidationResult::success();
               });
  register_key(config, "logging.enable_console", true, ConfigType::Boolean, "Write log lines to stdout/stderr");
  register_key(config, "logging.file_path", std::string(), ConfigType::String, "Log file, empty to disable");
}

void ConfigPresets::setup_all_defaults(const std::shared_ptr<ConfigManager>& config) {
  setup_connection_defaults(config);
  setup_multiplexer_defaults(config);
  setup_logging_defaults(config);
}

}  // namespace config
}  // namespace bluelink
