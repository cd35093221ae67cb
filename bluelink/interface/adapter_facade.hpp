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
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "bluelink/base/common.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/interface/duplex_channel.hpp"
#include "bluelink/stream/stream.hpp"

namespace bluelink {
namespace interface {

/**
 * @brief Platform Bluetooth adapter as seen by the connection manager
 *
 * Completion handlers may be invoked on any thread, including inline from the
 * initiating call. A cancelled listen completes with operation_aborted or not at all.
 */
class BLUELINK_API AdapterFacade {
 public:
  using ChannelHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<DuplexChannel>)>;
  using ProfileHandler = std::function<void(const base::ProfileEvent&)>;

  virtual ~AdapterFacade() = default;

  /// False when the device has no Bluetooth adapter at all.
  virtual bool is_radio_available() const = 0;

  virtual bool is_radio_enabled() const = 0;

  /// Changes of the radio-enabled flag; does not replay the current value.
  virtual stream::Stream<bool> radio_state_changes() = 0;

  virtual stream::Stream<base::LinkEvent> link_events() = 0;

  virtual std::vector<base::PeerId> bonded_devices() const = 0;

  /// Permissions still required before connecting; empty when authorized.
  virtual std::vector<std::string> missing_permissions() const = 0;

  /// Opens a server socket for @p service, accepts exactly one connection, then stops listening.
  virtual void async_listen_once(const base::ServiceRecord& service, ChannelHandler handler) = 0;

  virtual void cancel_listen() = 0;

  virtual void async_connect_to(const base::PeerId& peer, const base::ServiceRecord& service,
                                ChannelHandler handler) = 0;

  /**
   * @brief Bind a profile proxy and report its connection changes to @p handler
   * @return false when the proxy cannot be obtained
   */
  virtual bool request_profile_proxy(int profile, ProfileHandler handler) = 0;

  virtual void close_profile_proxy(int profile) = 0;
};

}  // namespace interface
}  // namespace bluelink
