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
#include <chrono>
#include <cmath>
#include <functional>
#include <memory>
#include <random>

#include "bluelink/diagnostics/error_types.hpp"

namespace bluelink {
namespace config {

struct RetryDecision {
  bool retry{false};
  std::chrono::milliseconds delay{0};
};

/**
 * @brief Decides whether a failed listen is re-armed, and after how long
 *
 * Receives the failure and the number of retries already made (0-based).
 */
using RetryPolicy = std::function<RetryDecision(const diagnostics::ErrorInfo&, uint32_t)>;

inline RetryPolicy FixedInterval(std::chrono::milliseconds delay) {
  return [delay](const diagnostics::ErrorInfo& error_info, uint32_t) -> RetryDecision {
    if (!error_info.retryable) {
      return {false, std::chrono::milliseconds(0)};
    }
    return {true, delay};
  };
}

/**
 * @brief Delay grows by @p factor per attempt up to @p max_delay
 * @param jitter Pick uniformly between 0 and the computed delay
 */
inline RetryPolicy ExponentialBackoff(std::chrono::milliseconds min_delay, std::chrono::milliseconds max_delay,
                                      double factor = 2.0, bool jitter = true) {
  std::shared_ptr<std::mt19937> rng;
  if (jitter) {
    std::random_device rd;
    rng = std::make_shared<std::mt19937>(rd());
  }

  return [min_delay, max_delay, factor, rng](const diagnostics::ErrorInfo& error_info,
                                             uint32_t attempt) -> RetryDecision {
    if (!error_info.retryable) {
      return {false, std::chrono::milliseconds(0)};
    }
    double delay_ms = std::min(static_cast<double>(min_delay.count()) * std::pow(factor, attempt),
                               static_cast<double>(max_delay.count()));
    if (rng) {
      std::uniform_real_distribution<> dist(0.0, delay_ms);
      delay_ms = dist(*rng);
    }
    return {true, std::chrono::milliseconds(static_cast<long long>(delay_ms))};
  };
}

}  // namespace config
}  // namespace bluelink
