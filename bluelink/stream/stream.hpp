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

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <functional>
#include <memory>
#include <utility>

#include "bluelink/base/error_context.hpp"
#include "bluelink/stream/broadcast.hpp"
#include "bluelink/stream/observer.hpp"
#include "bluelink/stream/subscription.hpp"

namespace bluelink {
namespace stream {

template <typename T>
Observer<T> make_observer(typename Observer<T>::NextHandler on_next,
                          typename Observer<T>::ErrorHandler on_error = nullptr,
                          typename Observer<T>::CompleteHandler on_complete = nullptr) {
  return Observer<T>{std::move(on_next), std::move(on_error), std::move(on_complete)};
}

/**
 * @brief Copyable handle to a subscribable sequence
 *
 * A Stream does nothing until subscribed. Notifications for one subscription are
 * delivered on the strand passed to subscribe(), or on a fresh strand of the stream's
 * io_context.
 */
template <typename T>
class Stream {
 public:
  using SubscribeFn = std::function<Subscription(Observer<T>, Strand)>;

  Stream(boost::asio::io_context& ioc, SubscribeFn subscribe_fn) : ioc_(&ioc), subscribe_fn_(std::move(subscribe_fn)) {}

  Subscription subscribe(Observer<T> observer) const {
    return subscribe_fn_(std::move(observer), boost::asio::make_strand(*ioc_));
  }

  Subscription subscribe(Observer<T> observer, Strand strand) const {
    return subscribe_fn_(std::move(observer), std::move(strand));
  }

  boost::asio::io_context& context() const { return *ioc_; }

  /**
   * @brief Stream attached to a broadcast
   * @param on_subscribed Invoked after each subscriber is registered, used to start
   *        lazy producers only once someone is listening
   */
  static Stream from(std::shared_ptr<Broadcast<T>> hub, std::function<void()> on_subscribed = nullptr) {
    auto& ioc = hub->context();
    return Stream(ioc, [hub, on_subscribed](Observer<T> observer, Strand strand) {
      Subscription subscription = hub->subscribe(std::move(observer), std::move(strand));
      if (on_subscribed) {
        on_subscribed();
      }
      return subscription;
    });
  }

  /// Every subscriber immediately receives on_error.
  static Stream failed(boost::asio::io_context& ioc, const ErrorContext& error) {
    auto hub = Broadcast<T>::create(ioc, 0);
    hub->fail(error);
    return from(hub);
  }

  /// Every subscriber immediately receives on_complete.
  static Stream completed(boost::asio::io_context& ioc) {
    auto hub = Broadcast<T>::create(ioc, 0);
    hub->complete();
    return from(hub);
  }

  /**
   * @brief Prepend the value produced by @p initial at subscription time
   *
   * The initial value is read before the upstream subscription is made and delivered
   * ahead of anything the upstream emits.
   */
  Stream start_with(std::function<T()> initial) const {
    Stream upstream = *this;
    return Stream(*ioc_, [upstream, initial](Observer<T> observer, Strand strand) {
      auto gate = std::make_shared<std::atomic<bool>>(true);
      T value = initial();
      boost::asio::post(strand, [gate, on_next = observer.on_next, value]() {
        if (gate->load() && on_next) {
          detail::invoke_guarded("on_next", [&]() { on_next(value); });
        }
      });
      auto inner = std::make_shared<Subscription>(upstream.subscribe(std::move(observer), strand));
      return Subscription([gate, inner]() {
        gate->store(false);
        inner->unsubscribe();
      });
    });
  }

 private:
  boost::asio::io_context* ioc_;
  SubscribeFn subscribe_fn_;
};

}  // namespace stream
}  // namespace bluelink
