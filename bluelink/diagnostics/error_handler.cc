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

#include "bluelink/diagnostics/error_handler.hpp"

#include <algorithm>

#include "bluelink/base/constants.hpp"
#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace diagnostics {

namespace {
constexpr size_t MAX_COMPONENT_ERRORS = 100;
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler handler;
  return handler;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load() || error.level < min_level_.load()) {
    return;
  }

  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_errors++;
    stats_.errors_by_level[static_cast<int>(error.level)]++;
    stats_.errors_by_category[static_cast<int>(error.category)]++;
    if (error.retryable) {
      stats_.retryable_errors++;
    }
    if (stats_.first_error == std::chrono::system_clock::time_point{}) {
      stats_.first_error = error.timestamp;
    }
    stats_.last_error = error.timestamp;

    recent_errors_.push_back(error);
    while (recent_errors_.size() > base::constants::DEFAULT_MAX_RECENT_ERRORS) {
      recent_errors_.pop_front();
    }

    auto& per_component = component_errors_[error.component];
    per_component.push_back(error);
    if (per_component.size() > MAX_COMPONENT_ERRORS) {
      per_component.erase(per_component.begin());
    }

    callbacks = callbacks_;
  }

  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Logger directly, reporting here would recurse
      BLUELINK_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    }
  }
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  recent_errors_.clear();
  component_errors_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_errors_by_component(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = component_errors_.find(component);
  if (it == component_errors_.end()) {
    return {};
  }
  return it->second;
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t skip = recent_errors_.size() > count ? recent_errors_.size() - count : 0;
  return std::vector<ErrorInfo>(recent_errors_.begin() + static_cast<std::ptrdiff_t>(skip), recent_errors_.end());
}

size_t ErrorHandler::get_error_count(const std::string& component, ErrorLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = component_errors_.find(component);
  if (it == component_errors_.end()) {
    return 0;
  }
  return static_cast<size_t>(
      std::count_if(it->second.begin(), it->second.end(), [level](const ErrorInfo& e) { return e.level == level; }));
}

namespace error_reporting {

void report_connection_error(const std::string& component, const std::string& operation,
                             const boost::system::error_code& ec, bool retryable) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONNECTION, component, operation, ec.message(), ec, retryable);
  ErrorHandler::instance().report_error(error);
}

void report_communication_error(const std::string& component, const std::string& operation,
                                const boost::system::error_code& ec, bool retryable) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::COMMUNICATION, component, operation, ec.message(), ec,
                  retryable);
  ErrorHandler::instance().report_error(error);
}

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_profile_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::PROFILE, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message,
                         const boost::system::error_code& ec) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::SYSTEM, component, operation, message, ec);
  ErrorHandler::instance().report_error(error);
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::UNKNOWN, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_info(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::INFO, ErrorCategory::UNKNOWN, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace bluelink
