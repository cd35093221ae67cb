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

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <string>

#include "bluelink/base/error_codes.hpp"
#include "bluelink/base/error_context.hpp"

namespace bluelink {
namespace diagnostics {

/**
 * @brief True when the error means the channel is gone (peer hang-up or local close)
 */
inline bool is_channel_closed(const boost::system::error_code& ec) {
  return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
         ec == boost::asio::error::connection_aborted || ec == boost::asio::error::broken_pipe ||
         ec == boost::asio::error::bad_descriptor || ec == boost::asio::error::not_connected ||
         ec == boost::asio::error::shut_down || ec == boost::asio::error::operation_aborted;
}

inline ErrorCode to_bluelink_error_code(const boost::system::error_code& ec) {
  if (!ec) {
    return ErrorCode::Success;
  }
  if (is_channel_closed(ec)) {
    return ErrorCode::TransportClosed;
  }
  if (ec == boost::asio::error::connection_refused) {
    return ErrorCode::ConnectionRefused;
  }
  if (ec == boost::asio::error::timed_out) {
    return ErrorCode::TimedOut;
  }
  if (ec == boost::asio::error::access_denied) {
    return ErrorCode::PermissionDenied;
  }
  if (ec == boost::asio::error::already_connected) {
    return ErrorCode::AlreadyConnected;
  }
  return ErrorCode::TransportError;
}

/**
 * @brief Classify a failed channel read or write into the error delivered to observers
 *
 * Only two kinds come out of a channel: TransportClosed or TransportError.
 */
inline ErrorContext classify_channel_error(const boost::system::error_code& ec, const std::string& operation) {
  if (is_channel_closed(ec)) {
    return ErrorContext(ErrorCode::TransportClosed, "Channel closed during " + operation, ec);
  }
  return ErrorContext(ErrorCode::TransportError, operation + " failed", ec);
}

/**
 * @brief Whether a failed listen/accept may be retried by a retry policy
 */
inline bool is_retryable_listen_error(const boost::system::error_code& ec) {
  if (!ec) return false;
  // Cancelled by us, never retried
  if (ec == boost::asio::error::operation_aborted) return false;
  if (ec == boost::asio::error::access_denied) return false;
  return true;
}

}  // namespace diagnostics
}  // namespace bluelink
