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

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <functional>

#include "bluelink/base/error_context.hpp"

namespace bluelink {
namespace stream {

/// Executor every subscriber's notifications are serialized on.
using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

/**
 * @brief Callbacks of one subscriber
 *
 * After on_error or on_complete nothing else is delivered. Any callback may be empty.
 */
template <typename T>
struct Observer {
  using NextHandler = std::function<void(const T&)>;
  using ErrorHandler = std::function<void(const ErrorContext&)>;
  using CompleteHandler = std::function<void()>;

  NextHandler on_next;
  ErrorHandler on_error;
  CompleteHandler on_complete;
};

}  // namespace stream
}  // namespace bluelink
