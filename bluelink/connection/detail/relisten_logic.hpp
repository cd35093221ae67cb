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

#include <chrono>
#include <cstdint>
#include <optional>

#include "bluelink/base/constants.hpp"
#include "bluelink/config/connection_config.hpp"
#include "bluelink/config/retry_policy.hpp"
#include "bluelink/diagnostics/error_types.hpp"

namespace bluelink {
namespace connection {
namespace detail {

constexpr auto MAX_RELISTEN_DELAY = std::chrono::milliseconds(base::constants::MAX_RETRY_DELAY_MS);

/**
 * @brief Outcome of a failed listen: stay down, or listen again after a delay
 *
 * An empty delay means "use the configured fixed interval".
 */
struct RelistenDecision {
  bool should_retry{false};
  std::optional<std::chrono::milliseconds> delay{std::nullopt};
};

/**
 * @brief Decide whether a failed listen is retried without an outside event
 *
 * @param cfg Connection configuration; listen_max_retries of 0 disables retries
 * @param error_info The failure just reported
 * @param attempt_count Retries already made since the last successful accept (0-based)
 * @param policy Optional custom policy, its delay is clamped to [0, 30s]
 */
inline RelistenDecision decide_relisten(const config::ConnectionConfig& cfg, const diagnostics::ErrorInfo& error_info,
                                        uint32_t attempt_count, const std::optional<config::RetryPolicy>& policy) {
  if (!error_info.retryable) {
    return {false, std::nullopt};
  }

  if (cfg.listen_max_retries == 0) {
    return {false, std::nullopt};
  }

  if (cfg.listen_max_retries > 0 && attempt_count >= static_cast<uint32_t>(cfg.listen_max_retries)) {
    return {false, std::nullopt};
  }

  if (policy) {
    auto decision = (*policy)(error_info, attempt_count);
    if (!decision.retry) {
      return {false, std::nullopt};
    }

    auto delay_ms = decision.delay;
    if (delay_ms < std::chrono::milliseconds(0)) {
      delay_ms = std::chrono::milliseconds(0);
    }
    if (delay_ms > MAX_RELISTEN_DELAY) {
      delay_ms = MAX_RELISTEN_DELAY;
    }
    return {true, delay_ms};
  }

  return {true, std::nullopt};
}

}  // namespace detail
}  // namespace connection
}  // namespace bluelink
