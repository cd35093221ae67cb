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
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "bluelink/base/common.hpp"
#include "bluelink/base/error_context.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/config/connection_config.hpp"
#include "bluelink/interface/adapter_facade.hpp"
#include "bluelink/multiplexer/stream_multiplexer.hpp"
#include "bluelink/stream/broadcast.hpp"
#include "bluelink/stream/state_signal.hpp"
#include "bluelink/stream/stream.hpp"

namespace bluelink {
namespace connection {

namespace net = boost::asio;

/**
 * @brief Single-connection state machine over an AdapterFacade
 *
 * Arbitrates between listening for one inbound connection and connecting out to a
 * peer, and owns at most one active StreamMultiplexer. Adapter notifications and
 * completions are handled on an internal strand; every transition runs under one
 * mutex and never blocks on I/O.
 *
 * Connection lifecycle failures are only observable through connection_state().
 * async_connect() reports PermissionDenied, AlreadyConnected and InProgress to its
 * handler, as well as the outcome of the attempt.
 */
class BLUELINK_API ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
 public:
  enum class Phase { Idle, Listening, Connecting, Connected, Disconnected, Error };

  using ConnectHandler = std::function<void(const ErrorContext&)>;

  /// Throws ConfigurationException when @p cfg is invalid.
  static std::shared_ptr<ConnectionManager> create(std::shared_ptr<interface::AdapterFacade> adapter,
                                                   const config::ConnectionConfig& cfg = config::ConnectionConfig{});

  static std::shared_ptr<ConnectionManager> create(std::shared_ptr<interface::AdapterFacade> adapter,
                                                   const config::ConnectionConfig& cfg, net::io_context& ioc);

  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /// Subscribes to radio and link events. Listening is armed once the radio reports enabled.
  void start();

  /// Cancels listening, drops the active connection and publishes DISCONNECTED.
  void stop();

  /// Current status first, then distinct changes.
  stream::Stream<base::ConnectionStatus> connection_state() const;

  /// Records of whichever connection is active at delivery time.
  stream::Stream<base::Record> incoming_data() const;

  void async_connect(const base::PeerId& peer, ConnectHandler handler = nullptr);

  /// Idempotent when nothing is connected.
  void disconnect();

  /// Arms listening explicitly, for auto_listen == false or after a failed listen.
  bool start_listening();

  bool send(const base::Record& record);
  bool send(const std::vector<uint8_t>& bytes);
  bool send(std::string_view text);

  bool is_connected() const;
  std::optional<base::PeerId> bound_peer() const;
  base::ConnectionStatus status() const;
  Phase phase() const;

  /// Gives access to byte and text streams of the current connection, null when none.
  std::shared_ptr<multiplexer::StreamMultiplexer> active_multiplexer() const;

  std::vector<base::PeerId> bonded_devices() const;

 private:
  struct TaggedRecord {
    uint64_t generation;
    base::Record record;
  };

  using MultiplexerPtr = std::shared_ptr<multiplexer::StreamMultiplexer>;
  using ChannelPtr = std::shared_ptr<interface::DuplexChannel>;

  ConnectionManager(std::shared_ptr<interface::AdapterFacade> adapter, const config::ConnectionConfig& cfg,
                    net::io_context& ioc);

  // Strand handlers
  void on_radio_state(bool enabled);
  void on_link_event(const base::LinkEvent& event);
  void on_listen_result(uint64_t generation, const boost::system::error_code& ec, ChannelPtr channel);
  void on_connect_result(uint64_t generation, const base::PeerId& peer, const boost::system::error_code& ec,
                         ChannelPtr channel);
  void on_channel_terminated(uint64_t generation, std::optional<ErrorContext> error);
  void on_relisten_timer();

  // The *_locked helpers require mutex_
  bool arm_listening_locked();
  bool rearm_locked();
  void cancel_listen_locked();
  void listen_failed_locked(const boost::system::error_code& ec);
  // Outbound connections are attributed to the requested peer, accepted ones to the channel
  void bind_locked(ChannelPtr channel, const base::PeerId& peer);
  MultiplexerPtr detach_locked();
  ConnectHandler abandon_connect_locked();
  void set_phase_locked(Phase phase);

  static void close_quietly(const ChannelPtr& channel);

  std::shared_ptr<interface::AdapterFacade> adapter_;
  config::ConnectionConfig cfg_;
  net::io_context& ioc_;
  stream::Strand strand_;
  net::steady_timer retry_timer_;

  stream::StateSignal<base::ConnectionStatus> state_;
  std::shared_ptr<stream::Broadcast<TaggedRecord>> incoming_;
  std::shared_ptr<std::atomic<uint64_t>> generation_;

  mutable std::mutex mutex_;
  Phase phase_ = Phase::Idle;
  bool started_ = false;
  bool radio_enabled_ = false;

  bool listening_ = false;
  uint64_t listen_generation_ = 0;
  uint32_t listen_attempts_ = 0;

  bool connecting_ = false;
  uint64_t connect_generation_ = 0;
  ConnectHandler pending_connect_;

  MultiplexerPtr active_;
  uint64_t active_generation_ = 0;
  std::optional<base::PeerId> bound_peer_;
  stream::Subscription relay_;

  stream::Subscription radio_sub_;
  stream::Subscription link_sub_;
};

BLUELINK_API const char* to_cstr(ConnectionManager::Phase phase);

}  // namespace connection
}  // namespace bluelink
