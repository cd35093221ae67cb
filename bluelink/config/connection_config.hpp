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

#include <optional>
#include <string>

#include "bluelink/base/common.hpp"
#include "bluelink/base/constants.hpp"
#include "bluelink/config/multiplexer_config.hpp"
#include "bluelink/config/retry_policy.hpp"

namespace bluelink {
namespace config {

struct ConnectionConfig {
  std::string service_name = base::constants::DEFAULT_SERVICE_NAME;
  std::string service_uuid = base::constants::SERIAL_PORT_SERVICE_UUID;

  // Arm listening whenever the radio is on and nothing is connected
  bool auto_listen = true;
  // Re-arm listening after an explicit disconnect()
  bool relisten_after_disconnect = true;

  // Failed listens are reported and left alone unless retries are enabled here
  int listen_max_retries = base::constants::DEFAULT_LISTEN_MAX_RETRIES;  // -1 = unlimited
  unsigned listen_retry_interval_ms = base::constants::DEFAULT_RETRY_INTERVAL_MS;
  std::optional<RetryPolicy> listen_retry_policy;

  MultiplexerConfig multiplexer;

  base::ServiceRecord service() const { return base::ServiceRecord{service_name, service_uuid}; }

  bool is_valid() const {
    return !service_name.empty() && service_name.size() <= base::constants::MAX_SERVICE_NAME_LENGTH &&
           !service_uuid.empty() && listen_retry_interval_ms >= base::constants::MIN_RETRY_INTERVAL_MS &&
           listen_retry_interval_ms <= base::constants::MAX_RETRY_INTERVAL_MS &&
           (listen_max_retries == -1 ||
            (listen_max_retries >= 0 && listen_max_retries <= base::constants::MAX_RETRIES_LIMIT)) &&
           multiplexer.is_valid();
  }

  void validate_and_clamp() {
    if (service_name.size() > base::constants::MAX_SERVICE_NAME_LENGTH) {
      service_name.resize(base::constants::MAX_SERVICE_NAME_LENGTH);
    }
    if (listen_retry_interval_ms < base::constants::MIN_RETRY_INTERVAL_MS) {
      listen_retry_interval_ms = base::constants::MIN_RETRY_INTERVAL_MS;
    } else if (listen_retry_interval_ms > base::constants::MAX_RETRY_INTERVAL_MS) {
      listen_retry_interval_ms = base::constants::MAX_RETRY_INTERVAL_MS;
    }
    if (listen_max_retries < -1) {
      listen_max_retries = 0;
    } else if (listen_max_retries > base::constants::MAX_RETRIES_LIMIT) {
      listen_max_retries = base::constants::MAX_RETRIES_LIMIT;
    }
    multiplexer.validate_and_clamp();
  }
};

}  // namespace config
}  // namespace bluelink
