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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bluelink {
namespace base {

/// Remote device identity, typically a "00:11:22:AA:BB:CC" hardware address.
using PeerId = std::string;

/**
 * @brief Published connection status
 *
 * Only CONNECTED carries the peer it is bound to. DISCONNECTED may name the peer that
 * went away when the loss was attributed to one.
 */
struct ConnectionStatus {
  enum class Kind { Disconnected, WaitingForConnection, Connected, ConnectionError };

  Kind kind = Kind::Disconnected;
  std::optional<PeerId> peer;

  static ConnectionStatus disconnected(std::optional<PeerId> p = std::nullopt) {
    return ConnectionStatus{Kind::Disconnected, std::move(p)};
  }
  static ConnectionStatus waiting_for_connection() { return ConnectionStatus{Kind::WaitingForConnection, std::nullopt}; }
  static ConnectionStatus connected(PeerId p) { return ConnectionStatus{Kind::Connected, std::move(p)}; }
  static ConnectionStatus connection_error() { return ConnectionStatus{Kind::ConnectionError, std::nullopt}; }

  bool operator==(const ConnectionStatus& other) const { return kind == other.kind && peer == other.peer; }
  bool operator!=(const ConnectionStatus& other) const { return !(*this == other); }
};

/**
 * @brief Link-layer notification, independent of the socket lifecycle
 */
struct LinkEvent {
  enum class Kind { Connected, DisconnectRequested, Disconnected };

  Kind kind = Kind::Connected;
  PeerId peer;
};

/**
 * @brief Typed message exchanged through a channel's record primitives
 */
struct Record {
  std::string type;
  std::vector<uint8_t> payload;

  bool operator==(const Record& other) const { return type == other.type && payload == other.payload; }
  bool operator!=(const Record& other) const { return !(*this == other); }
};

/// Service advertised when listening and targeted when connecting.
struct ServiceRecord {
  std::string name;
  std::string uuid;
};

/**
 * @brief Connection notification from a profile proxy (headset, A2DP, ...)
 */
struct ProfileEvent {
  enum class State { Connected, Disconnected };

  State state = State::Connected;
  int profile = 0;
  std::vector<PeerId> connected_devices;
};

// LCOV_EXCL_START
inline const char* to_cstr(ConnectionStatus::Kind kind) {
  switch (kind) {
    case ConnectionStatus::Kind::Disconnected:
      return "DISCONNECTED";
    case ConnectionStatus::Kind::WaitingForConnection:
      return "WAITING_FOR_CONNECTION";
    case ConnectionStatus::Kind::Connected:
      return "CONNECTED";
    case ConnectionStatus::Kind::ConnectionError:
      return "CONNECTION_ERROR";
  }
  return "?";
}

inline const char* to_cstr(LinkEvent::Kind kind) {
  switch (kind) {
    case LinkEvent::Kind::Connected:
      return "CONNECTED";
    case LinkEvent::Kind::DisconnectRequested:
      return "DISCONNECT_REQUESTED";
    case LinkEvent::Kind::Disconnected:
      return "DISCONNECTED";
  }
  return "?";
}
// LCOV_EXCL_STOP

inline std::string to_string(const ConnectionStatus& status) {
  std::string out = to_cstr(status.kind);
  if (status.peer) {
    out += "(" + *status.peer + ")";
  }
  return out;
}

// Safe type conversion utilities
namespace safe_convert {

inline std::string uint8_to_string(const uint8_t* data, size_t size) {
  if (!data || size == 0) {
    return std::string{};
  }
  return std::string(data, data + size);
}

inline std::vector<uint8_t> string_to_uint8(std::string_view str) {
  return std::vector<uint8_t>(str.begin(), str.end());
}

}  // namespace safe_convert

}  // namespace base
}  // namespace bluelink
