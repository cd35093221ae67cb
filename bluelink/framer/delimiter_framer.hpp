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

#include <array>
#include <vector>

#include "bluelink/base/constants.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/framer/iframer.hpp"

namespace bluelink {
namespace framer {

/**
 * @brief Framer that splits on any byte of a delimiter set
 *
 * Every delimiter byte is its own boundary: the buffered bytes are emitted (an empty
 * message when nothing is buffered) and the buffer is cleared. Runs of delimiters do
 * not collapse, so "AB\r\nCD" with {CR, LF} yields "AB", "", and "CD" once flushed.
 */
class BLUELINK_API DelimiterFramer : public IFramer {
 public:
  /**
   * @param delimiters Boundary bytes; an empty set falls back to {CR, LF}
   * @param max_length Longest partial message kept before it is discarded, 0 for no limit
   */
  explicit DelimiterFramer(const std::vector<uint8_t>& delimiters = default_delimiters(),
                           size_t max_length = base::constants::DEFAULT_MAX_TEXT_LENGTH);

  ~DelimiterFramer() override = default;

  void push_bytes(const uint8_t* data, size_t size) override;
  void set_on_message(MessageCallback cb) override;
  void flush() override;
  void reset() override;

  size_t buffered() const { return buffer_.size(); }

  static std::vector<uint8_t> default_delimiters() {
    return {base::constants::CARRIAGE_RETURN, base::constants::LINE_FEED};
  }

 private:
  std::array<bool, 256> is_delimiter_{};
  size_t max_length_;
  std::vector<uint8_t> buffer_;
  MessageCallback on_message_;
};

}  // namespace framer
}  // namespace bluelink
