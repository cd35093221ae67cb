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

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bluelink/base/constants.hpp"
#include "bluelink/base/error_context.hpp"
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/logger.hpp"
#include "bluelink/stream/observer.hpp"
#include "bluelink/stream/subscription.hpp"

namespace bluelink {
namespace stream {

namespace detail {

template <typename T>
struct Subscriber {
  Subscriber(Observer<T> obs, Strand s) : observer(std::move(obs)), strand(std::move(s)) {}

  Observer<T> observer;
  Strand strand;
  std::atomic<bool> active{true};
  std::atomic<size_t> pending{0};
};

// Observer code must not unwind into the io_context
template <typename Fn>
void invoke_guarded(const char* operation, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    BLUELINK_LOG_ERROR("stream", operation, "Observer threw: " + std::string(e.what()));
    diagnostics::error_reporting::report_system_error("stream", operation, "Exception in observer: " +
                                                                               std::string(e.what()));
  } catch (...) {
    BLUELINK_LOG_ERROR("stream", operation, "Observer threw an unknown exception");
    diagnostics::error_reporting::report_system_error("stream", operation, "Unknown exception in observer");
  }
}

}  // namespace detail

/**
 * @brief Hot multicast source
 *
 * One producer, any number of subscribers. A subscriber sees only values published
 * after it subscribed. Each subscriber has its own strand and an unbounded delivery
 * queue, so publish() never waits for a slow consumer; a warning is logged whenever a
 * subscriber's backlog reaches the backpressure threshold.
 *
 * After fail() or complete() the broadcast is terminated: further publishes are
 * ignored and new subscribers receive the terminal signal immediately.
 */
template <typename T>
class Broadcast : public std::enable_shared_from_this<Broadcast<T>> {
 public:
  using SubscriberPtr = std::shared_ptr<detail::Subscriber<T>>;

  static std::shared_ptr<Broadcast> create(
      boost::asio::io_context& ioc, size_t backpressure_threshold = base::constants::DEFAULT_BACKPRESSURE_THRESHOLD) {
    return std::shared_ptr<Broadcast>(new Broadcast(ioc, backpressure_threshold));
  }

  Subscription subscribe(Observer<T> observer) { return subscribe(std::move(observer), boost::asio::make_strand(ioc_)); }

  /**
   * @brief Attach a subscriber
   * @param replay Value delivered before any later publish, unless the broadcast is terminated
   */
  Subscription subscribe(Observer<T> observer, Strand strand, std::optional<T> replay = std::nullopt) {
    auto sub = std::make_shared<detail::Subscriber<T>>(std::move(observer), std::move(strand));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_) {
        post_terminal(sub, error_);
        return Subscription();
      }
      if (replay) {
        post_next(sub, *replay);
      }
      subscribers_.push_back(sub);
    }

    std::weak_ptr<Broadcast> weak = this->weak_from_this();
    return Subscription([weak, sub]() {
      sub->active.store(false);
      if (auto self = weak.lock()) {
        self->remove(sub);
      }
    });
  }

  void publish(const T& value) {
    // Posting under the lock keeps one total order across concurrent publishers
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
      return;
    }
    for (const auto& sub : subscribers_) {
      post_next(sub, value);
    }
  }

  void fail(const ErrorContext& error) { terminate(error); }

  void complete() { terminate(std::nullopt); }

  bool is_terminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
  }

  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  boost::asio::io_context& context() const { return ioc_; }

 private:
  Broadcast(boost::asio::io_context& ioc, size_t backpressure_threshold)
      : ioc_(ioc), backpressure_threshold_(backpressure_threshold) {}

  void terminate(std::optional<ErrorContext> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
      return;
    }
    terminated_ = true;
    error_ = std::move(error);
    for (const auto& sub : subscribers_) {
      post_terminal(sub, error_);
    }
    subscribers_.clear();
  }

  void remove(const SubscriberPtr& sub) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), sub), subscribers_.end());
  }

  void post_next(const SubscriberPtr& sub, const T& value) {
    size_t backlog = sub->pending.fetch_add(1) + 1;
    if (backpressure_threshold_ > 0 && backlog == backpressure_threshold_) {
      BLUELINK_LOG_WARNING("stream", "publish",
                           "Subscriber backlog reached " + std::to_string(backlog) + " pending notifications");
    }
    boost::asio::post(sub->strand, [sub, value]() {
      sub->pending.fetch_sub(1);
      if (!sub->active.load() || !sub->observer.on_next) {
        return;
      }
      detail::invoke_guarded("on_next", [&]() { sub->observer.on_next(value); });
    });
  }

  static void post_terminal(const SubscriberPtr& sub, const std::optional<ErrorContext>& error) {
    boost::asio::post(sub->strand, [sub, error]() {
      if (!sub->active.exchange(false)) {
        return;
      }
      if (error) {
        if (sub->observer.on_error) {
          detail::invoke_guarded("on_error", [&]() { sub->observer.on_error(*error); });
        }
      } else if (sub->observer.on_complete) {
        detail::invoke_guarded("on_complete", [&]() { sub->observer.on_complete(); });
      }
    });
  }

  boost::asio::io_context& ioc_;
  size_t backpressure_threshold_;
  mutable std::mutex mutex_;
  std::vector<SubscriberPtr> subscribers_;
  bool terminated_ = false;
  std::optional<ErrorContext> error_;
};

}  // namespace stream
}  // namespace bluelink
