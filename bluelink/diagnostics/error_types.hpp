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

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>

namespace bluelink {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // normal operation info
  WARNING = 1,  // recoverable
  ERROR = 2,    // operation failed
  CRITICAL = 3  // unrecoverable
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  CONNECTION = 0,     // listen, connect, link loss
  COMMUNICATION = 1,  // channel reads and writes
  CONFIGURATION = 2,  // invalid config values
  PROFILE = 3,        // profile proxy requests
  SYSTEM = 4,         // callbacks, threads
  UNKNOWN = 5
};

inline const char* to_cstr(ErrorLevel level) {
  switch (level) {
    case ErrorLevel::INFO:
      return "INFO";
    case ErrorLevel::WARNING:
      return "WARNING";
    case ErrorLevel::ERROR:
      return "ERROR";
    case ErrorLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

inline const char* to_cstr(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::CONNECTION:
      return "CONNECTION";
    case ErrorCategory::COMMUNICATION:
      return "COMMUNICATION";
    case ErrorCategory::CONFIGURATION:
      return "CONFIGURATION";
    case ErrorCategory::PROFILE:
      return "PROFILE";
    case ErrorCategory::SYSTEM:
      return "SYSTEM";
    case ErrorCategory::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

/**
 * @brief A reported error with its origin
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // multiplexer, connection_manager, socket_channel, ...
  std::string operation;  // read_byte, listen, connect, ...
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;
  bool retryable;
  uint32_t retry_count;

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        timestamp(std::chrono::system_clock::now()),
        retryable(false),
        retry_count(0) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec, bool retry = false)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()),
        retryable(retry),
        retry_count(0) {}

  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << to_cstr(level) << "] [" << component << "] [" << operation << "] " << message;
    if (boost_error) {
      oss << " (boost: " << boost_error.message() << ", code: " << boost_error.value() << ")";
    }
    if (retryable) {
      oss << " [RETRYABLE, count: " << retry_count << "]";
    }
    return oss.str();
  }
};

/**
 * @brief Aggregated counters kept by ErrorHandler
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[4] = {0, 0, 0, 0};
  size_t errors_by_category[6] = {0, 0, 0, 0, 0, 0};
  size_t retryable_errors = 0;

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    retryable_errors = 0;
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace bluelink
