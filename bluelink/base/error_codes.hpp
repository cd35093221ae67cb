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

#include <string>

namespace bluelink {

/**
 * @brief Error kinds surfaced through streams, completion handlers and the error handler
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InternalError,

  // Authorization
  PermissionDenied,

  // Channel lifecycle
  TransportClosed,
  TransportError,
  ConnectionRefused,
  TimedOut,
  NotConnected,
  AlreadyConnected,
  InProgress,
  RadioUnavailable,
  Stopped,

  // Profile services
  ProxyUnavailable
};

inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid configuration";
    case ErrorCode::InternalError:
      return "Internal error";
    case ErrorCode::PermissionDenied:
      return "Permission denied";
    case ErrorCode::TransportClosed:
      return "Connection closed";
    case ErrorCode::TransportError:
      return "Transport error";
    case ErrorCode::ConnectionRefused:
      return "Connection refused";
    case ErrorCode::TimedOut:
      return "Operation timed out";
    case ErrorCode::NotConnected:
      return "Not connected";
    case ErrorCode::AlreadyConnected:
      return "Already connected";
    case ErrorCode::InProgress:
      return "Operation already in progress";
    case ErrorCode::RadioUnavailable:
      return "Radio unavailable";
    case ErrorCode::Stopped:
      return "Stopped";
    case ErrorCode::ProxyUnavailable:
      return "Failed to get profile proxy";
    default:
      return "Unknown error code";
  }
}

}  // namespace bluelink
