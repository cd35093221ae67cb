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
#include <cstddef>
#include <cstdint>
#include <vector>

#include "bluelink/base/common.hpp"
#include "bluelink/base/visibility.hpp"

namespace bluelink {
namespace transport {

/**
 * Wire layout of one record, all integers big-endian:
 *
 *   u32 body_length | u16 type_length | type bytes | payload bytes
 *
 * body_length counts everything after the length prefix.
 */
namespace record_codec {

BLUELINK_API std::vector<uint8_t> encode(const base::Record& record);

/// Body length from the 4-byte prefix.
BLUELINK_API uint32_t decode_length(const uint8_t* prefix);

/**
 * @brief Decode a body (everything after the length prefix)
 * @param ec Set to bad_message when the type length overruns the body
 */
BLUELINK_API base::Record decode_body(const uint8_t* body, size_t size, boost::system::error_code& ec);

}  // namespace record_codec

}  // namespace transport
}  // namespace bluelink
