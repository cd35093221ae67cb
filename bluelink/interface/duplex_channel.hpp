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

#include "bluelink/base/common.hpp"
#include "bluelink/base/visibility.hpp"

namespace bluelink {
namespace interface {

/**
 * @brief An established, bidirectional byte channel (accepted or connected socket)
 *
 * Reads block until data arrives or the channel fails. The read and write directions
 * may be used concurrently from different threads; close() may be called from any
 * thread and should wake blocked readers.
 */
class BLUELINK_API DuplexChannel {
 public:
  virtual ~DuplexChannel() = default;

  virtual uint8_t read_byte(boost::system::error_code& ec) = 0;

  /// Reads one typed record using the channel's own framing.
  virtual base::Record read_record(boost::system::error_code& ec) = 0;

  /// Writes all bytes or fails.
  virtual void write_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) = 0;

  virtual void write_record(const base::Record& record, boost::system::error_code& ec) = 0;

  virtual void close(boost::system::error_code& ec) = 0;

  virtual bool is_open() const = 0;

  virtual base::PeerId remote_peer() const = 0;
};

}  // namespace interface
}  // namespace bluelink
