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
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "bluelink/interface/adapter_facade.hpp"
#include "bluelink/stream/broadcast.hpp"

namespace bluelink {
namespace test {

/**
 * @brief Scriptable AdapterFacade
 *
 * Listen and connect requests stay pending until the test completes them. Handlers are
 * invoked on the calling test thread, outside the fake's lock.
 */
class FakeAdapter : public interface::AdapterFacade {
 public:
  using Handler = interface::AdapterFacade::ChannelHandler;

  explicit FakeAdapter(boost::asio::io_context& ioc)
      : ioc_(ioc),
        radio_hub_(stream::Broadcast<bool>::create(ioc)),
        link_hub_(stream::Broadcast<base::LinkEvent>::create(ioc)) {}

  // --- test side ---

  void set_radio_enabled(bool enabled) {
    radio_enabled_.store(enabled);
    radio_hub_->publish(enabled);
  }

  /// Changes the flag without notifying, as the platform does before a listener attaches.
  void preset_radio_enabled(bool enabled) { radio_enabled_.store(enabled); }

  void set_radio_available(bool available) { radio_available_.store(available); }

  void set_missing_permissions(std::vector<std::string> missing) {
    std::lock_guard<std::mutex> lock(mutex_);
    missing_ = std::move(missing);
  }

  void set_bonded(std::vector<base::PeerId> bonded) {
    std::lock_guard<std::mutex> lock(mutex_);
    bonded_ = std::move(bonded);
  }

  void set_profile_available(bool available) { profile_available_.store(available); }

  void emit_link(base::LinkEvent::Kind kind, const base::PeerId& peer) {
    link_hub_->publish(base::LinkEvent{kind, peer});
  }

  void emit_profile(int profile, const base::ProfileEvent& event) {
    ProfileHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = profile_handlers_.find(profile);
      if (it == profile_handlers_.end()) return;
      handler = it->second;
    }
    handler(event);
  }

  bool listen_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(listen_handler_);
  }

  bool connect_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(connect_handler_);
  }

  /// Completes the pending listen with an accepted channel. Returns false when none is pending.
  bool accept(std::shared_ptr<interface::DuplexChannel> channel) {
    return complete(listen_handler_, boost::system::error_code(), std::move(channel));
  }

  bool fail_listen(boost::system::error_code ec) { return complete(listen_handler_, ec, nullptr); }

  bool connect_succeeds(std::shared_ptr<interface::DuplexChannel> channel) {
    return complete(connect_handler_, boost::system::error_code(), std::move(channel));
  }

  bool fail_connect(boost::system::error_code ec) { return complete(connect_handler_, ec, nullptr); }

  size_t listen_calls() const { return listen_calls_.load(); }
  size_t cancel_calls() const { return cancel_calls_.load(); }
  size_t connect_calls() const { return connect_calls_.load(); }
  size_t profile_closes() const { return profile_closes_.load(); }

  base::PeerId last_connect_peer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_connect_peer_;
  }

  base::ServiceRecord last_service() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_service_;
  }

  // --- AdapterFacade ---

  bool is_radio_available() const override { return radio_available_.load(); }
  bool is_radio_enabled() const override { return radio_enabled_.load(); }

  stream::Stream<bool> radio_state_changes() override { return stream::Stream<bool>::from(radio_hub_); }

  stream::Stream<base::LinkEvent> link_events() override { return stream::Stream<base::LinkEvent>::from(link_hub_); }

  std::vector<base::PeerId> bonded_devices() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return bonded_;
  }

  std::vector<std::string> missing_permissions() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return missing_;
  }

  void async_listen_once(const base::ServiceRecord& service, ChannelHandler handler) override {
    listen_calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    last_service_ = service;
    listen_handler_ = std::move(handler);
  }

  void cancel_listen() override {
    cancel_calls_.fetch_add(1);
    complete(listen_handler_, boost::asio::error::operation_aborted, nullptr);
  }

  void async_connect_to(const base::PeerId& peer, const base::ServiceRecord& service,
                        ChannelHandler handler) override {
    connect_calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    last_connect_peer_ = peer;
    last_service_ = service;
    connect_handler_ = std::move(handler);
  }

  bool request_profile_proxy(int profile, ProfileHandler handler) override {
    if (!profile_available_.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    profile_handlers_[profile] = std::move(handler);
    return true;
  }

  void close_profile_proxy(int profile) override {
    profile_closes_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    profile_handlers_.erase(profile);
  }

 private:
  bool complete(Handler& slot, const boost::system::error_code& ec, std::shared_ptr<interface::DuplexChannel> channel) {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = std::move(slot);
      slot = nullptr;
    }
    if (!handler) {
      return false;
    }
    handler(ec, std::move(channel));
    return true;
  }

  boost::asio::io_context& ioc_;
  std::shared_ptr<stream::Broadcast<bool>> radio_hub_;
  std::shared_ptr<stream::Broadcast<base::LinkEvent>> link_hub_;

  std::atomic<bool> radio_enabled_{false};
  std::atomic<bool> radio_available_{true};
  std::atomic<bool> profile_available_{true};

  mutable std::mutex mutex_;
  std::vector<std::string> missing_;
  std::vector<base::PeerId> bonded_;
  Handler listen_handler_;
  Handler connect_handler_;
  base::PeerId last_connect_peer_;
  base::ServiceRecord last_service_;
  std::map<int, ProfileHandler> profile_handlers_;

  std::atomic<size_t> listen_calls_{0};
  std::atomic<size_t> cancel_calls_{0};
  std::atomic<size_t> connect_calls_{0};
  std::atomic<size_t> profile_closes_{0};
};

}  // namespace test
}  // namespace bluelink
