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

#include <cstddef>
#include <cstdint>

namespace bluelink {
namespace base {
namespace constants {

// Stream fan-out
constexpr size_t DEFAULT_BACKPRESSURE_THRESHOLD = 4096;    // pending deliveries per subscriber before warning
constexpr size_t MIN_BACKPRESSURE_THRESHOLD = 16;          // 16 pending deliveries
constexpr size_t MAX_BACKPRESSURE_THRESHOLD = 1u << 24;    // 16M pending deliveries

// Text segmentation
constexpr uint8_t CARRIAGE_RETURN = 0x0D;
constexpr uint8_t LINE_FEED = 0x0A;
constexpr size_t DEFAULT_MAX_TEXT_LENGTH = 0;              // 0 = unbounded
constexpr size_t MAX_TEXT_LENGTH_LIMIT = 64 * 1024 * 1024;  // 64MB

// Record framing
constexpr size_t RECORD_LENGTH_PREFIX_SIZE = 4;              // u32 body length
constexpr size_t RECORD_TYPE_PREFIX_SIZE = 2;                // u16 type length
constexpr size_t DEFAULT_MAX_RECORD_SIZE = 1024 * 1024;      // 1MB body
constexpr size_t MIN_RECORD_SIZE_LIMIT = RECORD_TYPE_PREFIX_SIZE;
constexpr size_t MAX_RECORD_SIZE_LIMIT = 64 * 1024 * 1024;  // 64MB body

// Listen retries
constexpr unsigned DEFAULT_RETRY_INTERVAL_MS = 2000;  // 2 seconds
constexpr unsigned MIN_RETRY_INTERVAL_MS = 100;       // 100ms minimum
constexpr unsigned MAX_RETRY_INTERVAL_MS = 300000;    // 5 minutes maximum
constexpr unsigned MAX_RETRY_DELAY_MS = 30000;        // cap applied to policy decisions
constexpr int DEFAULT_LISTEN_MAX_RETRIES = 0;         // failed listens are not retried
constexpr int MAX_RETRIES_LIMIT = 1000;

// Service identity
constexpr const char* DEFAULT_SERVICE_NAME = "bluelink";
constexpr const char* SERIAL_PORT_SERVICE_UUID = "00001101-0000-1000-8000-00805F9B34FB";
constexpr size_t MAX_SERVICE_NAME_LENGTH = 248;

// Error handling
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;

}  // namespace constants
}  // namespace base
}  // namespace bluelink
