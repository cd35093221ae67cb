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

#include "bluelink/transport/record_codec.hpp"

#include <boost/system/error_code.hpp>
#include <limits>
#include <stdexcept>

#include "bluelink/base/constants.hpp"

namespace bluelink {
namespace transport {
namespace record_codec {

using base::constants::RECORD_LENGTH_PREFIX_SIZE;
using base::constants::RECORD_TYPE_PREFIX_SIZE;

std::vector<uint8_t> encode(const base::Record& record) {
  if (record.type.size() > std::numeric_limits<uint16_t>::max()) {
    throw std::invalid_argument("Record type longer than 65535 bytes");
  }
  const size_t body = RECORD_TYPE_PREFIX_SIZE + record.type.size() + record.payload.size();
  if (body > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Record body too large");
  }

  std::vector<uint8_t> out;
  out.reserve(RECORD_LENGTH_PREFIX_SIZE + body);
  const auto body_len = static_cast<uint32_t>(body);
  out.push_back(static_cast<uint8_t>(body_len >> 24));
  out.push_back(static_cast<uint8_t>(body_len >> 16));
  out.push_back(static_cast<uint8_t>(body_len >> 8));
  out.push_back(static_cast<uint8_t>(body_len));
  const auto type_len = static_cast<uint16_t>(record.type.size());
  out.push_back(static_cast<uint8_t>(type_len >> 8));
  out.push_back(static_cast<uint8_t>(type_len));
  out.insert(out.end(), record.type.begin(), record.type.end());
  out.insert(out.end(), record.payload.begin(), record.payload.end());
  return out;
}

uint32_t decode_length(const uint8_t* prefix) {
  return (static_cast<uint32_t>(prefix[0]) << 24) | (static_cast<uint32_t>(prefix[1]) << 16) |
         (static_cast<uint32_t>(prefix[2]) << 8) | static_cast<uint32_t>(prefix[3]);
}

base::Record decode_body(const uint8_t* body, size_t size, boost::system::error_code& ec) {
  ec.clear();
  if (size < RECORD_TYPE_PREFIX_SIZE) {
    ec = boost::system::errc::make_error_code(boost::system::errc::bad_message);
    return {};
  }
  const size_t type_len = (static_cast<size_t>(body[0]) << 8) | static_cast<size_t>(body[1]);
  if (RECORD_TYPE_PREFIX_SIZE + type_len > size) {
    ec = boost::system::errc::make_error_code(boost::system::errc::bad_message);
    return {};
  }

  base::Record record;
  const uint8_t* type_begin = body + RECORD_TYPE_PREFIX_SIZE;
  record.type.assign(type_begin, type_begin + type_len);
  record.payload.assign(type_begin + type_len, body + size);
  return record;
}

}  // namespace record_codec
}  // namespace transport
}  // namespace bluelink
