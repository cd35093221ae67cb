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
#include <vector>

#include "bluelink/base/constants.hpp"

namespace bluelink {
namespace config {

struct MultiplexerConfig {
  // Boundary bytes used by text_stream() when no explicit set is given
  std::vector<uint8_t> delimiters{base::constants::CARRIAGE_RETURN, base::constants::LINE_FEED};
  size_t max_text_length = base::constants::DEFAULT_MAX_TEXT_LENGTH;  // 0 = unbounded
  size_t backpressure_threshold = base::constants::DEFAULT_BACKPRESSURE_THRESHOLD;

  bool is_valid() const {
    return !delimiters.empty() && max_text_length <= base::constants::MAX_TEXT_LENGTH_LIMIT &&
           backpressure_threshold >= base::constants::MIN_BACKPRESSURE_THRESHOLD &&
           backpressure_threshold <= base::constants::MAX_BACKPRESSURE_THRESHOLD;
  }

  void validate_and_clamp() {
    if (delimiters.empty()) {
      delimiters = {base::constants::CARRIAGE_RETURN, base::constants::LINE_FEED};
    }
    if (max_text_length > base::constants::MAX_TEXT_LENGTH_LIMIT) {
      max_text_length = base::constants::MAX_TEXT_LENGTH_LIMIT;
    }
    if (backpressure_threshold < base::constants::MIN_BACKPRESSURE_THRESHOLD) {
      backpressure_threshold = base::constants::MIN_BACKPRESSURE_THRESHOLD;
    } else if (backpressure_threshold > base::constants::MAX_BACKPRESSURE_THRESHOLD) {
      backpressure_threshold = base::constants::MAX_BACKPRESSURE_THRESHOLD;
    }
  }
};

}  // namespace config
}  // namespace bluelink
