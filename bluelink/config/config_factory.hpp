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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bluelink/base/visibility.hpp"
#include "bluelink/config/connection_config.hpp"
#include "bluelink/config/config_manager.hpp"
#include "bluelink/config/multiplexer_config.hpp"

namespace bluelink {
namespace config {

/**
 * Factory for configuration stores and the typed configs built from them
 */
class BLUELINK_API ConfigFactory {
 public:
  static std::shared_ptr<ConfigManager> create();

  /// Store with every preset key registered at its default value.
  static std::shared_ptr<ConfigManager> create_with_defaults();

  /// Defaults overlaid with @p filepath; a missing file leaves the defaults.
  static std::shared_ptr<ConfigManager> create_from_file(const std::string& filepath);

  /**
   * Build a ConnectionConfig from "connection.*" and "multiplexer.*" keys
   *
   * Missing or mistyped keys keep their defaults. The result is clamped to valid ranges.
   */
  static ConnectionConfig make_connection_config(const ConfigManager& config);

  static MultiplexerConfig make_multiplexer_config(const ConfigManager& config);

  /// Applies "logging.*" keys to the process-wide Logger.
  static void apply_logging_config(const ConfigManager& config);
};

/**
 * Registered keys with defaults and validators
 */
class BLUELINK_API ConfigPresets {
 public:
  static void setup_connection_defaults(const std::shared_ptr<ConfigManager>& config);
  static void setup_multiplexer_defaults(const std::shared_ptr<ConfigManager>& config);
  static void setup_logging_defaults(const std::shared_ptr<ConfigManager>& config);
  static void setup_all_defaults(const std::shared_ptr<ConfigManager>& config);
};

/**
 * Delimiter sets are written as comma separated hex bytes, e.g. "0D,0A"
 */
namespace delimiter_format {

BLUELINK_API std::optional<std::vector<uint8_t>> parse(const std::string& text);
BLUELINK_API std::string format(const std::vector<uint8_t>& delimiters);

}  // namespace delimiter_format

}  // namespace config
}  // namespace bluelink
