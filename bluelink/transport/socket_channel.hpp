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

#include <atomic>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <utility>

#include "bluelink/base/constants.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/interface/duplex_channel.hpp"

namespace bluelink {
namespace transport {

/**
 * @brief DuplexChannel over a connected stream socket
 *
 * Works with any stream socket family: an RFCOMM descriptor handed over by the
 * platform (AF_BLUETOOTH / BTPROTO_RFCOMM), or a local socket pair. Reads and writes
 * are blocking; records use the record_codec framing.
 *
 * close() shuts the socket down before closing it so that a reader blocked in
 * read_byte() or read_record() wakes with end-of-file.
 */
class BLUELINK_API SocketChannel : public interface::DuplexChannel {
 public:
  using Socket = boost::asio::generic::stream_protocol::socket;

  SocketChannel(Socket socket, base::PeerId peer,
                size_t max_record_size = base::constants::DEFAULT_MAX_RECORD_SIZE);

  /**
   * @brief Take ownership of a connected native socket
   * @return nullptr with @p ec set when the descriptor cannot be assigned
   */
  static std::shared_ptr<SocketChannel> adopt(boost::asio::io_context& ioc, int family, int protocol, int native_fd,
                                              base::PeerId peer, boost::system::error_code& ec,
                                              size_t max_record_size = base::constants::DEFAULT_MAX_RECORD_SIZE);

  /// Two channels connected to each other through a local socket pair.
  static std::pair<std::shared_ptr<SocketChannel>, std::shared_ptr<SocketChannel>> make_local_pair(
      boost::asio::io_context& ioc, base::PeerId first_peer, base::PeerId second_peer);

  ~SocketChannel() override;

  uint8_t read_byte(boost::system::error_code& ec) override;
  base::Record read_record(boost::system::error_code& ec) override;
  void write_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) override;
  void write_record(const base::Record& record, boost::system::error_code& ec) override;
  void close(boost::system::error_code& ec) override;
  bool is_open() const override { return open_.load(); }
  base::PeerId remote_peer() const override { return peer_; }

 private:
  Socket socket_;
  const base::PeerId peer_;
  const size_t max_record_size_;
  std::atomic<bool> open_{true};
};

}  // namespace transport
}  // namespace bluelink
