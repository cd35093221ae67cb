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

#include "bluelink/transport/socket_channel.hpp"

#include <algorithm>
#include <array>
#include <boost/asio/error.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <stdexcept>

#include "bluelink/diagnostics/logger.hpp"
#include "bluelink/transport/record_codec.hpp"

namespace bluelink {
namespace transport {

namespace net = boost::asio;
using base::constants::RECORD_LENGTH_PREFIX_SIZE;

SocketChannel::SocketChannel(Socket socket, base::PeerId peer, size_t max_record_size)
    : socket_(std::move(socket)),
      peer_(std::move(peer)),
      max_record_size_(std::clamp(max_record_size, base::constants::MIN_RECORD_SIZE_LIMIT,
                                  base::constants::MAX_RECORD_SIZE_LIMIT)) {
  open_.store(socket_.is_open());
}

std::shared_ptr<SocketChannel> SocketChannel::adopt(net::io_context& ioc, int family, int protocol, int native_fd,
                                                    base::PeerId peer, boost::system::error_code& ec,
                                                    size_t max_record_size) {
  Socket socket(ioc);
  socket.assign(net::generic::stream_protocol(family, protocol), native_fd, ec);
  if (ec) {
    BLUELINK_LOG_ERROR("socket_channel", "adopt", "Cannot assign descriptor: " + ec.message());
    return nullptr;
  }
  return std::make_shared<SocketChannel>(std::move(socket), std::move(peer), max_record_size);
}

std::pair<std::shared_ptr<SocketChannel>, std::shared_ptr<SocketChannel>> SocketChannel::make_local_pair(
    net::io_context& ioc, base::PeerId first_peer, base::PeerId second_peer) {
  net::local::stream_protocol::socket first(ioc);
  net::local::stream_protocol::socket second(ioc);
  net::local::connect_pair(first, second);
  // The first channel talks to second_peer and vice versa
  return {std::make_shared<SocketChannel>(Socket(std::move(first)), std::move(second_peer)),
          std::make_shared<SocketChannel>(Socket(std::move(second)), std::move(first_peer))};
}

SocketChannel::~SocketChannel() {
  boost::system::error_code ec;
  close(ec);
}

uint8_t SocketChannel::read_byte(boost::system::error_code& ec) {
  uint8_t value = 0;
  net::read(socket_, net::buffer(&value, 1), ec);
  return value;
}

base::Record SocketChannel::read_record(boost::system::error_code& ec) {
  std::array<uint8_t, RECORD_LENGTH_PREFIX_SIZE> prefix{};
  net::read(socket_, net::buffer(prefix), ec);
  if (ec) {
    return {};
  }

  const uint32_t body_len = record_codec::decode_length(prefix.data());
  if (body_len > max_record_size_) {
    BLUELINK_LOG_WARNING("socket_channel", "read_record",
                         "Record of " + std::to_string(body_len) + " bytes exceeds limit from " + peer_);
    ec = boost::system::errc::make_error_code(boost::system::errc::message_size);
    return {};
  }

  std::vector<uint8_t> body(body_len);
  net::read(socket_, net::buffer(body), ec);
  if (ec) {
    return {};
  }
  return record_codec::decode_body(body.data(), body.size(), ec);
}

void SocketChannel::write_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) {
  ec.clear();
  if (size == 0) {
    return;
  }
  net::write(socket_, net::buffer(data, size), ec);
}

void SocketChannel::write_record(const base::Record& record, boost::system::error_code& ec) {
  std::vector<uint8_t> frame;
  try {
    frame = record_codec::encode(record);
  } catch (const std::invalid_argument& e) {
    BLUELINK_LOG_WARNING("socket_channel", "write_record", e.what());
    ec = boost::system::errc::make_error_code(boost::system::errc::message_size);
    return;
  }
  net::write(socket_, net::buffer(frame), ec);
}

void SocketChannel::close(boost::system::error_code& ec) {
  ec.clear();
  if (!open_.exchange(false)) {
    return;
  }
  boost::system::error_code shutdown_ec;
  socket_.shutdown(net::socket_base::shutdown_both, shutdown_ec);
  socket_.close(ec);
}

}  // namespace transport
}  // namespace bluelink
