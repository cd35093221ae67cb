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

#include "bluelink/framer/delimiter_framer.hpp"

#include <string>

#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace framer {

DelimiterFramer::DelimiterFramer(const std::vector<uint8_t>& delimiters, size_t max_length)
    : max_length_(max_length) {
  const std::vector<uint8_t>& effective = delimiters.empty() ? default_delimiters() : delimiters;
  for (uint8_t b : effective) {
    is_delimiter_[b] = true;
  }
}

void DelimiterFramer::push_bytes(const uint8_t* data, size_t size) {
  if (!data || size == 0) return;

  for (size_t i = 0; i < size; ++i) {
    const uint8_t b = data[i];
    if (is_delimiter_[b]) {
      // Swap out first so a re-entrant push from the callback sees an empty buffer
      std::vector<uint8_t> message;
      message.swap(buffer_);
      if (on_message_) {
        on_message_(message.data(), message.size());
      }
      continue;
    }

    buffer_.push_back(b);
    if (max_length_ > 0 && buffer_.size() > max_length_) {
      BLUELINK_LOG_WARNING("delimiter_framer", "push_bytes",
                           "Partial message exceeded " + std::to_string(max_length_) + " bytes, discarding");
      buffer_.clear();
    }
  }
}

void DelimiterFramer::set_on_message(MessageCallback cb) { on_message_ = std::move(cb); }

void DelimiterFramer::flush() {
  if (buffer_.empty()) return;
  std::vector<uint8_t> message;
  message.swap(buffer_);
  if (on_message_) {
    on_message_(message.data(), message.size());
  }
}

void DelimiterFramer::reset() { buffer_.clear(); }

}  // namespace framer
}  // namespace bluelink
