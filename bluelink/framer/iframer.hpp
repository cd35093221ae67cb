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

#include <cstddef>
#include <cstdint>
#include <functional>

#include "bluelink/base/visibility.hpp"

namespace bluelink {
namespace framer {

/**
 * @brief Splits a byte stream into messages
 */
class BLUELINK_API IFramer {
 public:
  using MessageCallback = std::function<void(const uint8_t* data, size_t size)>;

  virtual ~IFramer() = default;

  /**
   * @brief Feed bytes; the message callback fires for every message completed by them
   */
  virtual void push_bytes(const uint8_t* data, size_t size) = 0;

  virtual void set_on_message(MessageCallback cb) = 0;

  /**
   * @brief Emit whatever partial message is buffered, if any
   *
   * Called when the byte source ends so a trailing message is not lost.
   */
  virtual void flush() = 0;

  /// Drop buffered bytes without emitting them.
  virtual void reset() = 0;
};

}  // namespace framer
}  // namespace bluelink
