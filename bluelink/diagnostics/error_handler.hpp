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

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "bluelink/base/visibility.hpp"
#include "bluelink/diagnostics/error_types.hpp"

namespace bluelink {
namespace diagnostics {

/**
 * @brief Central sink for errors raised anywhere in the library
 *
 * Errors are counted, kept in a bounded history and forwarded to registered
 * callbacks. Callers log before reporting. Callbacks run on the reporting thread and
 * must not block.
 */
class BLUELINK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /// Errors below this level are dropped before logging and counting.
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;
  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler() = default;

  mutable std::mutex mutex_;
  std::atomic<bool> enabled_{true};
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::vector<ErrorCallback> callbacks_;
  ErrorStats stats_;
  std::deque<ErrorInfo> recent_errors_;
  std::map<std::string, std::vector<ErrorInfo>> component_errors_;
};

namespace error_reporting {

BLUELINK_API void report_connection_error(const std::string& component, const std::string& operation,
                                          const boost::system::error_code& ec, bool retryable = true);

BLUELINK_API void report_communication_error(const std::string& component, const std::string& operation,
                                             const boost::system::error_code& ec, bool retryable = false);

BLUELINK_API void report_configuration_error(const std::string& component, const std::string& operation,
                                             const std::string& message);

BLUELINK_API void report_profile_error(const std::string& component, const std::string& operation,
                                       const std::string& message);

BLUELINK_API void report_system_error(const std::string& component, const std::string& operation,
                                      const std::string& message,
                                      const boost::system::error_code& ec = boost::system::error_code());

BLUELINK_API void report_warning(const std::string& component, const std::string& operation,
                                 const std::string& message);

BLUELINK_API void report_info(const std::string& component, const std::string& operation, const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace bluelink
