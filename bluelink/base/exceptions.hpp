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

#include <stdexcept>
#include <string>

namespace bluelink {

/**
 * @brief Base exception for bluelink
 *
 * Thrown only for caller misuse (invalid configuration, missing keys). Connection
 * lifecycle failures are never thrown; they arrive through streams and handlers.
 */
class BluelinkException : public std::runtime_error {
 public:
  explicit BluelinkException(const std::string& message, const std::string& component = "",
                             const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full = what();
    if (!component_.empty()) {
      full = "[" + component_ + "] " + full;
    }
    if (!operation_.empty()) {
      full += " (operation: " + operation_ + ")";
    }
    return full;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Invalid or missing configuration values
 */
class ConfigurationException : public BluelinkException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& key = "",
                                  const std::string& operation = "")
      : BluelinkException(message, "config", operation), key_(key) {}

  const std::string& get_key() const noexcept { return key_; }

  std::string get_full_message() const {
    std::string full = BluelinkException::get_full_message();
    if (!key_.empty()) {
      full += " (key: " + key_ + ")";
    }
    return full;
  }

 private:
  std::string key_;
};

}  // namespace bluelink
