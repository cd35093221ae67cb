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

#include "bluelink/connection/profile_proxy.hpp"

#include <string>
#include <utility>

#include "bluelink/concurrency/io_context_manager.hpp"
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/logger.hpp"
#include "bluelink/stream/broadcast.hpp"

namespace bluelink {
namespace connection {

using base::ProfileEvent;

stream::Stream<ProfileEvent> observe_profile(std::shared_ptr<interface::AdapterFacade> adapter, int profile,
                                             boost::asio::io_context& ioc) {
  auto* context = &ioc;
  return stream::Stream<ProfileEvent>(
      ioc, [adapter, profile, context](stream::Observer<ProfileEvent> observer, stream::Strand strand) {
        auto hub = stream::Broadcast<ProfileEvent>::create(*context, 0);
        stream::Subscription inner = hub->subscribe(std::move(observer), std::move(strand));

        const bool bound = adapter->request_profile_proxy(profile, [hub](const ProfileEvent& event) {
          hub->publish(event);
        });
        if (!bound) {
          const std::string message = "Failed to get profile proxy " + std::to_string(profile);
          BLUELINK_LOG_WARNING("profile_proxy", "request", message);
          diagnostics::error_reporting::report_profile_error("profile_proxy", "request", message);
          hub->fail(ErrorContext(ErrorCode::ProxyUnavailable, message));
          return inner;
        }

        BLUELINK_LOG_DEBUG("profile_proxy", "request", "Bound profile proxy " + std::to_string(profile));
        auto shared_inner = std::make_shared<stream::Subscription>(std::move(inner));
        return stream::Subscription([adapter, profile, shared_inner]() {
          shared_inner->unsubscribe();
          adapter->close_profile_proxy(profile);
          BLUELINK_LOG_DEBUG("profile_proxy", "close", "Closed profile proxy " + std::to_string(profile));
        });
      });
}

stream::Stream<ProfileEvent> observe_profile(std::shared_ptr<interface::AdapterFacade> adapter, int profile) {
  auto& manager = concurrency::IoContextManager::instance();
  manager.start();
  return observe_profile(std::move(adapter), profile, manager.get_context());
}

stream::Stream<bool> observe_radio_enabled(std::shared_ptr<interface::AdapterFacade> adapter) {
  stream::Stream<bool> changes = adapter->radio_state_changes();
  return changes.start_with([adapter]() { return adapter->is_radio_enabled(); });
}

}  // namespace connection
}  // namespace bluelink
