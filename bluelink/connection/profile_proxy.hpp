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

#include "bluelink/base/common.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/interface/adapter_facade.hpp"
#include "bluelink/stream/stream.hpp"

namespace bluelink {
namespace connection {

/**
 * @brief Connection changes reported by a profile proxy
 *
 * Each subscription requests its own proxy and closes it on unsubscribe. When the
 * proxy cannot be obtained the subscriber receives one ProxyUnavailable error and
 * nothing else.
 */
BLUELINK_API stream::Stream<base::ProfileEvent> observe_profile(std::shared_ptr<interface::AdapterFacade> adapter,
                                                                int profile, boost::asio::io_context& ioc);

/// Same, delivered on the shared IoContextManager context.
BLUELINK_API stream::Stream<base::ProfileEvent> observe_profile(std::shared_ptr<interface::AdapterFacade> adapter,
                                                                int profile);

/// The radio-enabled flag read at subscription time, followed by its changes.
BLUELINK_API stream::Stream<bool> observe_radio_enabled(std::shared_ptr<interface::AdapterFacade> adapter);

}  // namespace connection
}  // namespace bluelink
