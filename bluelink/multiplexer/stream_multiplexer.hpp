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
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "bluelink/base/common.hpp"
#include "bluelink/base/error_context.hpp"
#include "bluelink/base/visibility.hpp"
#include "bluelink/config/multiplexer_config.hpp"
#include "bluelink/interface/duplex_channel.hpp"
#include "bluelink/stream/broadcast.hpp"
#include "bluelink/stream/stream.hpp"

namespace bluelink {
namespace multiplexer {

/**
 * @brief Turns one DuplexChannel into shareable byte, text and record streams
 *
 * The byte and record streams are hot: the first subscription starts a dedicated
 * reader thread for that kind and every later subscriber attaches to the same loop.
 * The text stream is derived from the byte stream, with one segmenter per subscriber.
 *
 * A read or write failure closes the multiplexer. Subscribers then receive
 * TransportClosed when the peer or local side hung up, TransportError otherwise. An
 * explicit close() completes the streams instead. The channel is never revived: after
 * close every accessor returns a stream that terminates immediately.
 *
 * Reader threads keep the multiplexer alive until they exit, so owners must call
 * close() to release a channel that never fails on its own.
 */
class BLUELINK_API StreamMultiplexer : public std::enable_shared_from_this<StreamMultiplexer> {
 public:
  using ByteStream = stream::Stream<uint8_t>;
  using TextStream = stream::Stream<std::string>;
  using RecordStream = stream::Stream<base::Record>;

  /// Uses the shared IoContextManager context for notifications.
  static std::shared_ptr<StreamMultiplexer> create(std::shared_ptr<interface::DuplexChannel> channel,
                                                   const config::MultiplexerConfig& cfg = config::MultiplexerConfig{});

  static std::shared_ptr<StreamMultiplexer> create(std::shared_ptr<interface::DuplexChannel> channel,
                                                   const config::MultiplexerConfig& cfg, boost::asio::io_context& ioc);

  ~StreamMultiplexer();

  StreamMultiplexer(const StreamMultiplexer&) = delete;
  StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

  ByteStream byte_stream();

  /// Segments on the configured default delimiters.
  TextStream text_stream();

  /**
   * @brief Text segmented on any byte of @p delimiters
   *
   * Each delimiter byte emits the pending text, an empty string when nothing is
   * pending. When the byte stream ends, pending text is emitted once before the
   * terminal signal.
   */
  TextStream text_stream(const std::vector<uint8_t>& delimiters);

  RecordStream record_stream();

  // Writes are serialized against each other, never against reads. All return false
  // once closed or when the channel fails, and a failure closes the multiplexer.
  bool send(const std::vector<uint8_t>& bytes);
  bool send(const base::Record& record);
  bool send(std::string_view text);

  /// Idempotent. Closing errors are logged and swallowed.
  void close();

  bool is_open() const;
  const base::PeerId& remote_peer() const { return peer_; }

  /// Number of reader loops ever started, at most one per stream kind.
  size_t read_loops_started() const { return loops_started_.load(); }

 private:
  template <typename T>
  struct Producer {
    std::shared_ptr<stream::Broadcast<T>> hub;
    bool running = false;
    std::thread worker;
  };

  StreamMultiplexer(std::shared_ptr<interface::DuplexChannel> channel, const config::MultiplexerConfig& cfg,
                    boost::asio::io_context& ioc);

  void start_byte_loop();
  void start_record_loop();
  void run_byte_loop(std::shared_ptr<stream::Broadcast<uint8_t>> hub);
  void run_record_loop(std::shared_ptr<stream::Broadcast<base::Record>> hub);

  void handle_read_failure(const char* operation, const boost::system::error_code& ec);
  bool write(const char* operation, const std::function<void(boost::system::error_code&)>& op);
  void fail(const ErrorContext& error);

  template <typename T>
  stream::Stream<T> dead_stream() const;

  template <typename T>
  static void terminate(const std::shared_ptr<stream::Broadcast<T>>& hub, const std::optional<ErrorContext>& failure);

  static void join_or_detach(std::thread& worker);

  std::shared_ptr<interface::DuplexChannel> channel_;
  config::MultiplexerConfig cfg_;
  boost::asio::io_context& ioc_;
  const base::PeerId peer_;

  mutable std::mutex mutex_;
  std::atomic<bool> closed_{false};
  std::optional<ErrorContext> failure_;
  Producer<uint8_t> bytes_;
  Producer<base::Record> records_;
  std::atomic<size_t> loops_started_{0};

  std::mutex write_mutex_;
};

}  // namespace multiplexer
}  // namespace bluelink
