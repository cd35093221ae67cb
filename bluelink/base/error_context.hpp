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

#include <boost/system/error_code.hpp>
#include <string>
#include <string_view>

#include "bluelink/base/error_codes.hpp"

namespace bluelink {

/**
 * @brief Error value delivered to stream observers and completion handlers
 *
 * A default constructed context means success.
 */
class ErrorContext {
 public:
  ErrorContext() = default;
  ErrorContext(ErrorCode code, std::string_view message, boost::system::error_code cause = {})
      : code_(code), message_(message), cause_(cause) {}

  ErrorCode code() const noexcept { return code_; }
  std::string_view message() const noexcept { return message_; }
  const boost::system::error_code& cause() const noexcept { return cause_; }
  bool ok() const noexcept { return code_ == ErrorCode::Success; }

  std::string describe() const {
    std::string out = to_string(code_);
    if (!message_.empty()) {
      out += ": " + message_;
    }
    if (cause_) {
      out += " (" + cause_.message() + ")";
    }
    return out;
  }

 private:
  ErrorCode code_{ErrorCode::Success};
  std::string message_;
  boost::system::error_code cause_;
};

}  // namespace bluelink
