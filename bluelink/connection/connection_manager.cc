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

#include "bluelink/connection/connection_manager.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>
#include <utility>

#include "bluelink/base/exceptions.hpp"
#include "bluelink/concurrency/io_context_manager.hpp"
#include "bluelink/connection/detail/relisten_logic.hpp"
#include "bluelink/connection/profile_proxy.hpp"
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/error_mapping.hpp"
#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace connection {

using base::ConnectionStatus;
using base::LinkEvent;
using namespace diagnostics;

std::shared_ptr<ConnectionManager> ConnectionManager::create(std::shared_ptr<interface::AdapterFacade> adapter,
                                                             const config::ConnectionConfig& cfg) {
  auto& manager = concurrency::IoContextManager::instance();
  manager.start();
  return create(std::move(adapter), cfg, manager.get_context());
}

std::shared_ptr<ConnectionManager> ConnectionManager::create(std::shared_ptr<interface::AdapterFacade> adapter,
                                                             const config::ConnectionConfig& cfg,
                                                             net::io_context& ioc) {
  if (!adapter) {
    throw ConfigurationException("Adapter must not be null", "adapter", "create");
  }
  if (!cfg.is_valid()) {
    BLUELINK_LOG_ERROR("connection_manager", "create", "Invalid connection configuration");
    error_reporting::report_configuration_error("connection_manager", "create", "Invalid connection configuration");
    throw ConfigurationException("Invalid connection configuration", "connection", "create");
  }
  return std::shared_ptr<ConnectionManager>(new ConnectionManager(std::move(adapter), cfg, ioc));
}

ConnectionManager::ConnectionManager(std::shared_ptr<interface::AdapterFacade> adapter,
                                     const config::ConnectionConfig& cfg, net::io_context& ioc)
    : adapter_(std::move(adapter)),
      cfg_(cfg),
      ioc_(ioc),
      strand_(net::make_strand(ioc)),
      retry_timer_(strand_),
      state_(ioc, ConnectionStatus::disconnected()),
      incoming_(stream::Broadcast<TaggedRecord>::create(ioc, cfg.multiplexer.backpressure_threshold)),
      generation_(std::make_shared<std::atomic<uint64_t>>(0)) {}

ConnectionManager::~ConnectionManager() {
  MultiplexerPtr doomed;
  ConnectHandler abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = false;
    radio_sub_.unsubscribe();
    link_sub_.unsubscribe();
    cancel_listen_locked();
    abandoned = abandon_connect_locked();
    doomed = detach_locked();
  }
  if (doomed) {
    doomed->close();
  }
  if (abandoned) {
    abandoned(ErrorContext(ErrorCode::Stopped, "Connection manager destroyed"));
  }
  state_.complete();
  incoming_->complete();
}

void ConnectionManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return;
  }
  started_ = true;
  BLUELINK_LOG_INFO("connection_manager", "start", "Starting, service " + cfg_.service_name);

  std::weak_ptr<ConnectionManager> weak = weak_from_this();
  radio_sub_ = observe_radio_enabled(adapter_).subscribe(
      stream::make_observer<bool>(
          [weak](const bool& enabled) {
            if (auto self = weak.lock()) {
              self->on_radio_state(enabled);
            }
          },
          [](const ErrorContext& error) {
            BLUELINK_LOG_WARNING("connection_manager", "radio", "Radio state stream failed: " + error.describe());
          }),
      strand_);

  link_sub_ = adapter_->link_events().subscribe(
      stream::make_observer<LinkEvent>(
          [weak](const LinkEvent& event) {
            if (auto self = weak.lock()) {
              self->on_link_event(event);
            }
          },
          [](const ErrorContext& error) {
            BLUELINK_LOG_WARNING("connection_manager", "link", "Link event stream failed: " + error.describe());
          }),
      strand_);
}

void ConnectionManager::stop() {
  MultiplexerPtr doomed;
  ConnectHandler abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ && !active_ && !connecting_) {
      return;
    }
    BLUELINK_LOG_INFO("connection_manager", "stop", "Stopping");
    started_ = false;
    radio_enabled_ = false;
    radio_sub_.unsubscribe();
    link_sub_.unsubscribe();
    cancel_listen_locked();
    abandoned = abandon_connect_locked();
    doomed = detach_locked();
    bound_peer_.reset();
    set_phase_locked(Phase::Idle);
    state_.publish(ConnectionStatus::disconnected());
  }
  if (doomed) {
    doomed->close();
  }
  if (abandoned) {
    abandoned(ErrorContext(ErrorCode::Stopped, "Connection manager stopped"));
  }
}

stream::Stream<ConnectionStatus> ConnectionManager::connection_state() const { return state_.stream(); }

stream::Stream<base::Record> ConnectionManager::incoming_data() const {
  auto hub = incoming_;
  auto current = generation_;
  return stream::Stream<base::Record>(
      hub->context(), [hub, current](stream::Observer<base::Record> observer, stream::Strand strand) {
        // Filtered at delivery so records queued before a switch never surface
        stream::Observer<TaggedRecord> tagged;
        tagged.on_next = [current, on_next = std::move(observer.on_next)](const TaggedRecord& item) {
          if (on_next && item.generation == current->load()) {
            on_next(item.record);
          }
        };
        tagged.on_error = std::move(observer.on_error);
        tagged.on_complete = std::move(observer.on_complete);
        return hub->subscribe(std::move(tagged), std::move(strand));
      });
}

void ConnectionManager::async_connect(const base::PeerId& peer, ConnectHandler handler) {
  const auto missing = adapter_->missing_permissions();
  if (!missing.empty()) {
    std::string joined;
    for (const auto& permission : missing) {
      if (!joined.empty()) joined += ", ";
      joined += permission;
    }
    BLUELINK_LOG_WARNING("connection_manager", "connect", "Missing permissions: " + joined);
    error_reporting::report_warning("connection_manager", "connect", "Missing permissions: " + joined);
    if (handler) {
      handler(ErrorContext(ErrorCode::PermissionDenied, "Missing permissions: " + joined));
    }
    return;
  }

  ErrorContext rejected;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
      rejected = ErrorContext(ErrorCode::AlreadyConnected, "Already connected to " + bound_peer_.value_or("?"));
    } else if (connecting_) {
      rejected = ErrorContext(ErrorCode::InProgress, "Another connect is in flight");
    } else {
      cancel_listen_locked();
      connecting_ = true;
      pending_connect_ = std::move(handler);
      generation = ++connect_generation_;
      set_phase_locked(Phase::Connecting);
    }
  }
  if (!rejected.ok()) {
    BLUELINK_LOG_DEBUG("connection_manager", "connect", "Rejected: " + rejected.describe());
    if (handler) {
      handler(rejected);
    }
    return;
  }

  BLUELINK_LOG_INFO("connection_manager", "connect", "Connecting to " + peer);
  std::weak_ptr<ConnectionManager> weak = weak_from_this();
  auto strand = strand_;
  adapter_->async_connect_to(
      peer, cfg_.service(),
      [weak, strand, generation, peer](const boost::system::error_code& ec, ChannelPtr channel) {
        net::post(strand, [weak, generation, peer, ec, channel]() {
          if (auto self = weak.lock()) {
            self->on_connect_result(generation, peer, ec, channel);
          } else {
            close_quietly(channel);
          }
        });
      });
}

void ConnectionManager::disconnect() {
  MultiplexerPtr doomed;
  ConnectHandler abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ && !bound_peer_ && !connecting_) {
      BLUELINK_LOG_DEBUG("connection_manager", "disconnect", "Nothing to disconnect");
      return;
    }
    BLUELINK_LOG_INFO("connection_manager", "disconnect", "Disconnecting from " + bound_peer_.value_or("<pending>"));
    abandoned = abandon_connect_locked();
    doomed = detach_locked();
    bound_peer_.reset();
    set_phase_locked(Phase::Disconnected);
    state_.publish(ConnectionStatus::disconnected());
    if (cfg_.relisten_after_disconnect) {
      rearm_locked();
    } else {
      set_phase_locked(Phase::Idle);
    }
  }
  if (doomed) {
    doomed->close();
  }
  if (abandoned) {
    abandoned(ErrorContext(ErrorCode::Stopped, "Disconnected before the connect completed"));
  }
}

bool ConnectionManager::start_listening() {
  std::lock_guard<std::mutex> lock(mutex_);
  listen_attempts_ = 0;
  return arm_listening_locked();
}

bool ConnectionManager::send(const base::Record& record) {
  auto mux = active_multiplexer();
  return mux && mux->send(record);
}

bool ConnectionManager::send(const std::vector<uint8_t>& bytes) {
  auto mux = active_multiplexer();
  return mux && mux->send(bytes);
}

bool ConnectionManager::send(std::string_view text) {
  auto mux = active_multiplexer();
  return mux && mux->send(text);
}

bool ConnectionManager::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}

std::optional<base::PeerId> ConnectionManager::bound_peer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bound_peer_;
}

ConnectionStatus ConnectionManager::status() const { return state_.value(); }

ConnectionManager::Phase ConnectionManager::phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

std::shared_ptr<multiplexer::StreamMultiplexer> ConnectionManager::active_multiplexer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::vector<base::PeerId> ConnectionManager::bonded_devices() const { return adapter_->bonded_devices(); }

void ConnectionManager::on_radio_state(bool enabled) {
  MultiplexerPtr doomed;
  ConnectHandler abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
      return;
    }
    radio_enabled_ = enabled;
    if (enabled) {
      BLUELINK_LOG_INFO("connection_manager", "radio", "Radio enabled");
      listen_attempts_ = 0;
      if (cfg_.auto_listen) {
        arm_listening_locked();
      }
    } else {
      BLUELINK_LOG_INFO("connection_manager", "radio", "Radio disabled");
      cancel_listen_locked();
      abandoned = abandon_connect_locked();
      doomed = detach_locked();
      bound_peer_.reset();
      set_phase_locked(Phase::Idle);
      state_.publish(ConnectionStatus::disconnected());
    }
  }
  if (doomed) {
    doomed->close();
  }
  if (abandoned) {
    abandoned(ErrorContext(ErrorCode::RadioUnavailable, "Radio disabled during connect"));
  }
}

void ConnectionManager::on_link_event(const LinkEvent& event) {
  MultiplexerPtr doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
      return;
    }
    switch (event.kind) {
      case LinkEvent::Kind::Connected:
        if (bound_peer_ && *bound_peer_ != event.peer) {
          BLUELINK_LOG_DEBUG("connection_manager", "link",
                             "Ignoring link-up of " + event.peer + " while bound to " + *bound_peer_);
          return;
        }
        bound_peer_ = event.peer;
        set_phase_locked(Phase::Connected);
        state_.publish(ConnectionStatus::connected(event.peer));
        break;

      case LinkEvent::Kind::DisconnectRequested:
        BLUELINK_LOG_INFO("connection_manager", "link", event.peer + " requested disconnect");
        break;

      case LinkEvent::Kind::Disconnected:
        if (!bound_peer_ || *bound_peer_ != event.peer) {
          BLUELINK_LOG_DEBUG("connection_manager", "link", "Ignoring link loss of unbound peer " + event.peer);
          return;
        }
        BLUELINK_LOG_INFO("connection_manager", "link", "Link to " + event.peer + " lost");
        doomed = detach_locked();
        bound_peer_.reset();
        set_phase_locked(Phase::Disconnected);
        state_.publish(ConnectionStatus::disconnected(event.peer));
        rearm_locked();
        break;
    }
  }
  if (doomed) {
    doomed->close();
  }
}

void ConnectionManager::on_listen_result(uint64_t generation, const boost::system::error_code& ec,
                                         ChannelPtr channel) {
  ChannelPtr stray;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != listen_generation_ || !listening_) {
      stray = std::move(channel);
    } else {
      listening_ = false;
      if (ec || !channel) {
        stray = std::move(channel);
        listen_failed_locked(ec ? ec : boost::system::errc::make_error_code(boost::system::errc::io_error));
      } else if (active_) {
        BLUELINK_LOG_WARNING("connection_manager", "listen",
                             "Already connected, dropping connection from " + channel->remote_peer());
        stray = std::move(channel);
      } else {
        listen_attempts_ = 0;
        const base::PeerId peer = channel->remote_peer();
        BLUELINK_LOG_INFO("connection_manager", "listen", "Accepted connection from " + peer);
        bind_locked(std::move(channel), peer);
      }
    }
  }
  close_quietly(stray);
}

void ConnectionManager::on_connect_result(uint64_t generation, const base::PeerId& peer,
                                          const boost::system::error_code& ec, ChannelPtr channel) {
  ChannelPtr stray;
  ConnectHandler handler;
  ErrorContext result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != connect_generation_ || !connecting_) {
      stray = std::move(channel);
    } else {
      connecting_ = false;
      handler = std::move(pending_connect_);
      pending_connect_ = nullptr;
      if (ec || !channel) {
        stray = std::move(channel);
        result = ErrorContext(ec ? to_bluelink_error_code(ec) : ErrorCode::TransportError,
                              "Connect to " + peer + " failed", ec);
        BLUELINK_LOG_ERROR("connection_manager", "connect", result.describe());
        error_reporting::report_connection_error("connection_manager", "connect", ec, true);
        set_phase_locked(Phase::Error);
        state_.publish(ConnectionStatus::connection_error());
      } else if (active_) {
        stray = std::move(channel);
        result = ErrorContext(ErrorCode::AlreadyConnected, "Already connected to " + bound_peer_.value_or("?"));
      } else {
        BLUELINK_LOG_INFO("connection_manager", "connect", "Connected to " + peer);
        bind_locked(std::move(channel), peer);
      }
    }
  }
  close_quietly(stray);
  if (handler) {
    handler(result);
  }
}

void ConnectionManager::on_channel_terminated(uint64_t generation, std::optional<ErrorContext> error) {
  MultiplexerPtr doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || generation != active_generation_) {
      return;
    }
    const auto peer = bound_peer_;
    doomed = detach_locked();
    bound_peer_.reset();
    if (!error || error->code() == ErrorCode::TransportClosed) {
      BLUELINK_LOG_INFO("connection_manager", "channel", "Connection to " + peer.value_or("?") + " closed");
      set_phase_locked(Phase::Disconnected);
      state_.publish(ConnectionStatus::disconnected(peer));
    } else {
      BLUELINK_LOG_ERROR("connection_manager", "channel",
                         "Connection to " + peer.value_or("?") + " failed: " + error->describe());
      set_phase_locked(Phase::Error);
      state_.publish(ConnectionStatus::connection_error());
    }
    rearm_locked();
  }
  if (doomed) {
    doomed->close();
  }
}

void ConnectionManager::on_relisten_timer() {
  std::lock_guard<std::mutex> lock(mutex_);
  // Something else moved the machine on while the timer was pending
  if (phase_ != Phase::Error) {
    return;
  }
  arm_listening_locked();
}

bool ConnectionManager::arm_listening_locked() {
  if (!started_ || active_ || connecting_ || bound_peer_) {
    return false;
  }
  if (!radio_enabled_) {
    BLUELINK_LOG_DEBUG("connection_manager", "listen", "Radio disabled, not listening");
    return false;
  }
  if (!adapter_->is_radio_available()) {
    BLUELINK_LOG_WARNING("connection_manager", "listen", "No Bluetooth adapter, not listening");
    return false;
  }

  set_phase_locked(Phase::Listening);
  state_.publish(ConnectionStatus::waiting_for_connection());
  if (listening_) {
    return true;
  }

  listening_ = true;
  const uint64_t generation = ++listen_generation_;
  BLUELINK_LOG_INFO("connection_manager", "listen", "Listening for " + cfg_.service_name);

  std::weak_ptr<ConnectionManager> weak = weak_from_this();
  auto strand = strand_;
  adapter_->async_listen_once(cfg_.service(), [weak, strand, generation](const boost::system::error_code& ec,
                                                                          ChannelPtr channel) {
    net::post(strand, [weak, generation, ec, channel]() {
      if (auto self = weak.lock()) {
        self->on_listen_result(generation, ec, channel);
      } else {
        close_quietly(channel);
      }
    });
  });
  return true;
}

bool ConnectionManager::rearm_locked() {
  if (cfg_.auto_listen && arm_listening_locked()) {
    return true;
  }
  set_phase_locked(Phase::Idle);
  return false;
}

void ConnectionManager::cancel_listen_locked() {
  retry_timer_.cancel();
  if (!listening_) {
    return;
  }
  listening_ = false;
  ++listen_generation_;
  BLUELINK_LOG_DEBUG("connection_manager", "listen", "Cancelling listen");
  adapter_->cancel_listen();
}

void ConnectionManager::listen_failed_locked(const boost::system::error_code& ec) {
  ErrorInfo info(ErrorLevel::ERROR, ErrorCategory::CONNECTION, "connection_manager", "listen",
                 "Listen failed: " + ec.message(), ec, is_retryable_listen_error(ec));
  info.retry_count = listen_attempts_;
  BLUELINK_LOG_ERROR("connection_manager", "listen", "Listen for " + cfg_.service_name + " failed: " + ec.message());
  ErrorHandler::instance().report_error(info);

  set_phase_locked(Phase::Error);
  state_.publish(ConnectionStatus::connection_error());

  const auto decision = detail::decide_relisten(cfg_, info, listen_attempts_, cfg_.listen_retry_policy);
  if (!decision.should_retry) {
    return;
  }
  ++listen_attempts_;
  const auto delay = decision.delay.value_or(std::chrono::milliseconds(cfg_.listen_retry_interval_ms));
  BLUELINK_LOG_INFO("connection_manager", "listen",
                    "Listening again in " + std::to_string(delay.count()) + " ms (attempt " +
                        std::to_string(listen_attempts_) + ")");

  std::weak_ptr<ConnectionManager> weak = weak_from_this();
  retry_timer_.expires_after(delay);
  retry_timer_.async_wait([weak](const boost::system::error_code& timer_ec) {
    if (timer_ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->on_relisten_timer();
    }
  });
}

void ConnectionManager::bind_locked(ChannelPtr channel, const base::PeerId& peer) {
  const uint64_t generation = generation_->fetch_add(1) + 1;
  auto mux = multiplexer::StreamMultiplexer::create(std::move(channel), cfg_.multiplexer, ioc_);
  active_ = mux;
  active_generation_ = generation;
  bound_peer_ = peer;

  set_phase_locked(Phase::Connected);
  state_.publish(ConnectionStatus::connected(peer));

  std::weak_ptr<ConnectionManager> weak = weak_from_this();
  auto incoming = incoming_;
  auto current = generation_;
  stream::Observer<base::Record> relay;
  relay.on_next = [incoming, current, generation](const base::Record& record) {
    if (current->load() == generation) {
      incoming->publish(TaggedRecord{generation, record});
    }
  };
  relay.on_error = [weak, generation](const ErrorContext& error) {
    if (auto self = weak.lock()) {
      self->on_channel_terminated(generation, error);
    }
  };
  relay.on_complete = [weak, generation]() {
    if (auto self = weak.lock()) {
      self->on_channel_terminated(generation, std::nullopt);
    }
  };
  // Starts the record reader, so the state above is published first
  relay_ = mux->record_stream().subscribe(std::move(relay), strand_);
}

ConnectionManager::MultiplexerPtr ConnectionManager::detach_locked() {
  generation_->fetch_add(1);
  relay_.unsubscribe();
  active_generation_ = 0;
  MultiplexerPtr mux = std::move(active_);
  active_.reset();
  return mux;
}

ConnectionManager::ConnectHandler ConnectionManager::abandon_connect_locked() {
  if (!connecting_) {
    return nullptr;
  }
  connecting_ = false;
  ++connect_generation_;
  ConnectHandler handler = std::move(pending_connect_);
  pending_connect_ = nullptr;
  return handler;
}

void ConnectionManager::set_phase_locked(Phase phase) {
  if (phase_ == phase) {
    return;
  }
  BLUELINK_LOG_DEBUG("connection_manager", "phase", std::string(to_cstr(phase_)) + " -> " + to_cstr(phase));
  phase_ = phase;
}

void ConnectionManager::close_quietly(const ChannelPtr& channel) {
  if (!channel) {
    return;
  }
  try {
    boost::system::error_code ec;
    channel->close(ec);
    if (ec) {
      BLUELINK_LOG_DEBUG("connection_manager", "close", "Ignoring close error: " + ec.message());
    }
  } catch (const std::exception& e) {
    BLUELINK_LOG_DEBUG("connection_manager", "close", "Ignoring exception while closing: " + std::string(e.what()));
  }
}

const char* to_cstr(ConnectionManager::Phase phase) {
  switch (phase) {
    case ConnectionManager::Phase::Idle:
      return "IDLE";
    case ConnectionManager::Phase::Listening:
      return "LISTENING";
    case ConnectionManager::Phase::Connecting:
      return "CONNECTING";
    case ConnectionManager::Phase::Connected:
      return "CONNECTED";
    case ConnectionManager::Phase::Disconnected:
      return "DISCONNECTED";
    case ConnectionManager::Phase::Error:
      return "ERROR";
  }
  return "?";
}

}  // namespace connection
}  // namespace bluelink
