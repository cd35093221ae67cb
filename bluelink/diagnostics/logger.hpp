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

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "bluelink/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace bluelink {
namespace diagnostics {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Process-wide logger
 *
 * Every line is rendered through a format string with the placeholders
 * {timestamp}, {level}, {component}, {operation} and {message}, then written to
 * each enabled output. Thread-safe.
 */
class BLUELINK_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  static Logger& instance();

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level);
  LogLevel get_level() const;

  void set_console_output(bool enable);

  /**
   * @brief Append log lines to a file
   * @param filename Log file path, empty to disable file output
   */
  void set_file_output(const std::string& filename);

  void set_callback(LogCallback callback);

  /**
   * @brief Replace the output set
   * @param outputs Bitwise OR of LogOutput flags
   */
  void set_outputs(int outputs);
  int get_outputs() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  void set_format(const std::string& format);

  void flush();

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

const char* to_cstr(LogLevel level);

}  // namespace diagnostics
}  // namespace bluelink

/**
 * @brief Logging macros; the message expression is only evaluated when the level passes
 */
#define BLUELINK_LOG_AT(level, method, component, operation, message)                 \
  do {                                                                                \
    if (bluelink::diagnostics::Logger::instance().get_level() <= (level)) {           \
      bluelink::diagnostics::Logger::instance().method(component, operation, message); \
    }                                                                                 \
  } while (0)

#define BLUELINK_LOG_DEBUG(component, operation, message) \
  BLUELINK_LOG_AT(bluelink::diagnostics::LogLevel::DEBUG, debug, component, operation, message)

#define BLUELINK_LOG_INFO(component, operation, message) \
  BLUELINK_LOG_AT(bluelink::diagnostics::LogLevel::INFO, info, component, operation, message)

#define BLUELINK_LOG_WARNING(component, operation, message) \
  BLUELINK_LOG_AT(bluelink::diagnostics::LogLevel::WARNING, warning, component, operation, message)

#define BLUELINK_LOG_ERROR(component, operation, message) \
  BLUELINK_LOG_AT(bluelink::diagnostics::LogLevel::ERROR, error, component, operation, message)

#define BLUELINK_LOG_CRITICAL(component, operation, message) \
  BLUELINK_LOG_AT(bluelink::diagnostics::LogLevel::CRITICAL, critical, component, operation, message)
