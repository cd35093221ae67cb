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
#include <memory>
#include <mutex>
#include <utility>

#include "bluelink/stream/broadcast.hpp"
#include "bluelink/stream/stream.hpp"

namespace bluelink {
namespace stream {

/**
 * @brief Current value plus distinct changes
 *
 * New subscribers first receive the current value, then every later value that
 * differs from its predecessor. Consecutive equal values are never delivered.
 */
template <typename T>
class StateSignal {
 public:
  StateSignal(boost::asio::io_context& ioc, T initial) : shared_(std::make_shared<Shared>()) {
    shared_->hub = Broadcast<T>::create(ioc, 0);
    shared_->current = std::move(initial);
  }

  /// Returns false when @p value equals the current value and nothing was published.
  bool publish(const T& value) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (value == shared_->current) {
      return false;
    }
    shared_->current = value;
    shared_->hub->publish(value);
    return true;
  }

  T value() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->current;
  }

  void complete() { shared_->hub->complete(); }

  Stream<T> stream() const {
    auto shared = shared_;
    return Stream<T>(shared->hub->context(), [shared](Observer<T> observer, Strand strand) {
      std::lock_guard<std::mutex> lock(shared->mutex);
      return shared->hub->subscribe(std::move(observer), std::move(strand), shared->current);
    });
  }

 private:
  struct Shared {
    std::mutex mutex;
    T current{};
    std::shared_ptr<Broadcast<T>> hub;
  };

  std::shared_ptr<Shared> shared_;
};

}  // namespace stream
}  // namespace bluelink
