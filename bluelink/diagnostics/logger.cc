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

#include "bluelink/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

namespace bluelink {
namespace diagnostics {

namespace {

struct FormatPart {
  enum Type { LITERAL, TIMESTAMP, LEVEL, COMPONENT, OPERATION, MESSAGE };
  Type type;
  std::string value;  // LITERAL only
};

std::vector<FormatPart> parse_format(const std::string& format) {
  std::vector<FormatPart> parts;
  size_t start = 0;
  size_t pos = 0;
  while ((pos = format.find('{', start)) != std::string::npos) {
    if (pos > start) {
      parts.push_back({FormatPart::LITERAL, format.substr(start, pos - start)});
    }
    size_t end = format.find('}', pos);
    if (end == std::string::npos) {
      parts.push_back({FormatPart::LITERAL, format.substr(pos)});
      start = format.size();
      break;
    }
    std::string placeholder = format.substr(pos + 1, end - pos - 1);
    if (placeholder == "timestamp") {
      parts.push_back({FormatPart::TIMESTAMP, ""});
    } else if (placeholder == "level") {
      parts.push_back({FormatPart::LEVEL, ""});
    } else if (placeholder == "component") {
      parts.push_back({FormatPart::COMPONENT, ""});
    } else if (placeholder == "operation") {
      parts.push_back({FormatPart::OPERATION, ""});
    } else if (placeholder == "message") {
      parts.push_back({FormatPart::MESSAGE, ""});
    } else {
      parts.push_back({FormatPart::LITERAL, format.substr(pos, end - pos + 1)});
    }
    start = end + 1;
  }
  if (start < format.size()) {
    parts.push_back({FormatPart::LITERAL, format.substr(start)});
  }
  return parts;
}

std::string timestamp_now() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm{};
#if defined(_WIN32)
  ::localtime_s(&tm, &tt);
#else
  ::localtime_r(&tt, &tm);
#endif
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms.count()));
  return out;
}

}  // namespace

const char* to_cstr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

struct Logger::Impl {
  mutable std::mutex mutex;
  std::atomic<LogLevel> level{LogLevel::INFO};
  std::atomic<bool> enabled{true};
  std::atomic<int> outputs{static_cast<int>(LogOutput::CONSOLE)};
  std::vector<FormatPart> format = parse_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
  std::unique_ptr<std::ofstream> file;
  LogCallback callback;

  std::string render(LogLevel lvl, std::string_view component, std::string_view operation,
                     std::string_view message) const {
    std::string result;
    result.reserve(message.size() + 64);
    for (const auto& part : format) {
      switch (part.type) {
        case FormatPart::LITERAL:
          result.append(part.value);
          break;
        case FormatPart::TIMESTAMP:
          result.append(timestamp_now());
          break;
        case FormatPart::LEVEL:
          result.append(to_cstr(lvl));
          break;
        case FormatPart::COMPONENT:
          result.append(component);
          break;
        case FormatPart::OPERATION:
          result.append(operation);
          break;
        case FormatPart::MESSAGE:
          result.append(message);
          break;
      }
    }
    return result;
  }
};

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() { flush(); }

void Logger::set_level(LogLevel level) { impl_->level.store(level); }

LogLevel Logger::get_level() const { return impl_->level.load(); }

void Logger::set_console_output(bool enable) {
  if (enable) {
    impl_->outputs.fetch_or(static_cast<int>(LogOutput::CONSOLE));
  } else {
    impl_->outputs.fetch_and(~static_cast<int>(LogOutput::CONSOLE));
  }
}

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->file.reset();
  if (filename.empty()) {
    impl_->outputs.fetch_and(~static_cast<int>(LogOutput::FILE));
    return;
  }
  auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
  if (!file->is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    impl_->outputs.fetch_and(~static_cast<int>(LogOutput::FILE));
    return;
  }
  impl_->file = std::move(file);
  impl_->outputs.fetch_or(static_cast<int>(LogOutput::FILE));
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->callback = std::move(callback);
  if (impl_->callback) {
    impl_->outputs.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    impl_->outputs.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

void Logger::set_outputs(int outputs) { impl_->outputs.store(outputs); }

int Logger::get_outputs() const { return impl_->outputs.load(); }

void Logger::set_enabled(bool enabled) { impl_->enabled.store(enabled); }

bool Logger::is_enabled() const { return impl_->enabled.load(); }

void Logger::set_format(const std::string& format) {
  auto parts = parse_format(format);
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->format = std::move(parts);
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->file && impl_->file->is_open()) {
    impl_->file->flush();
  }
  std::cout.flush();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!impl_->enabled.load() || level < impl_->level.load()) {
    return;
  }

  const int outputs = impl_->outputs.load();
  LogCallback callback;
  std::string line;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    line = impl_->render(level, component, operation, message);
    if ((outputs & static_cast<int>(LogOutput::FILE)) && impl_->file && impl_->file->is_open()) {
      *impl_->file << line << '\n';
    }
    if (outputs & static_cast<int>(LogOutput::CALLBACK)) {
      callback = impl_->callback;
    }
  }

  if (outputs & static_cast<int>(LogOutput::CONSOLE)) {
    if (level >= LogLevel::ERROR) {
      std::cerr << line << std::endl;
    } else {
      std::cout << line << '\n';
    }
  }

  if (callback) {
    try {
      callback(level, line);
    } catch (const std::exception& e) {
      std::cerr << "Error in log callback: " << e.what() << std::endl;
    }
  }
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

}  // namespace diagnostics
}  // namespace bluelink
