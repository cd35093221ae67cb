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

// Base types
#include "bluelink/base/common.hpp"
#include "bluelink/base/error_codes.hpp"
#include "bluelink/base/error_context.hpp"
#include "bluelink/base/exceptions.hpp"

// Error handling and logging
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/logger.hpp"

// Configuration
#include "bluelink/config/config_factory.hpp"
#include "bluelink/config/config_manager.hpp"
#include "bluelink/config/connection_config.hpp"
#include "bluelink/config/multiplexer_config.hpp"
#include "bluelink/config/retry_policy.hpp"

// Streams and connections
#include "bluelink/connection/connection_manager.hpp"
#include "bluelink/connection/profile_proxy.hpp"
#include "bluelink/interface/adapter_facade.hpp"
#include "bluelink/interface/duplex_channel.hpp"
#include "bluelink/multiplexer/stream_multiplexer.hpp"
#include "bluelink/stream/stream.hpp"
#include "bluelink/transport/socket_channel.hpp"

namespace bluelink {

// Convenience aliases for the public API
using ConnectionManager = connection::ConnectionManager;
using StreamMultiplexer = multiplexer::StreamMultiplexer;
using ConnectionConfig = config::ConnectionConfig;
using MultiplexerConfig = config::MultiplexerConfig;
using ConnectionStatus = base::ConnectionStatus;
using LinkEvent = base::LinkEvent;
using Record = base::Record;
using PeerId = base::PeerId;

/**
 * @brief Wrap an established channel in a multiplexer on the shared io_context
 */
inline std::shared_ptr<StreamMultiplexer> multiplex(std::shared_ptr<interface::DuplexChannel> channel,
                                                    const MultiplexerConfig& cfg = MultiplexerConfig{}) {
  return StreamMultiplexer::create(std::move(channel), cfg);
}

/**
 * @brief Connection manager on the shared io_context, already started
 */
inline std::shared_ptr<ConnectionManager> manage(std::shared_ptr<interface::AdapterFacade> adapter,
                                                 const ConnectionConfig& cfg = ConnectionConfig{}) {
  auto manager = ConnectionManager::create(std::move(adapter), cfg);
  manager->start();
  return manager;
}

}  // namespace bluelink
