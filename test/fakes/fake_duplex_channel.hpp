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
#include <boost/asio/error.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bluelink/interface/duplex_channel.hpp"
#include "bluelink/transport/record_codec.hpp"

namespace bluelink {
namespace test {

/**
 * @brief Scriptable in-memory DuplexChannel
 *
 * Reads block on queues fed by the test. Writes land in one shared "wire" one byte at
 * a time, yielding between bytes, so unserialized concurrent writers would interleave.
 */
class FakeDuplexChannel : public interface::DuplexChannel {
 public:
  explicit FakeDuplexChannel(base::PeerId peer = "00:11:22:33:44:55", bool close_unblocks_reads = true)
      : peer_(std::move(peer)), close_unblocks_reads_(close_unblocks_reads) {}

  // --- test side ---

  void feed_bytes(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_.insert(bytes_.end(), data.begin(), data.end());
    cv_.notify_all();
  }

  void feed_text(const std::string& text) { feed_bytes(std::vector<uint8_t>(text.begin(), text.end())); }

  void feed_record(const base::Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    cv_.notify_all();
  }

  /// Reads fail with @p ec once the queued input is drained.
  void end_input(boost::system::error_code ec = boost::asio::error::eof) {
    std::lock_guard<std::mutex> lock(mutex_);
    read_error_ = ec;
    cv_.notify_all();
  }

  void fail_writes_with(boost::system::error_code ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_error_ = ec;
  }

  void throw_on_close(bool enable) { throw_on_close_ = enable; }

  std::vector<uint8_t> wire() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wire_;
  }

  std::vector<base::Record> written_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_records_;
  }

  size_t read_calls() const { return read_calls_.load(); }
  size_t reads_started_after_close() const { return reads_after_close_.load(); }
  size_t max_concurrent_byte_reads() const { return max_byte_readers_.load(); }
  size_t max_concurrent_record_reads() const { return max_record_readers_.load(); }
  size_t close_calls() const { return close_calls_.load(); }

  /// True while some reader is blocked waiting for input.
  bool has_blocked_reader() const { return blocked_readers_.load() > 0; }

  // --- DuplexChannel ---

  uint8_t read_byte(boost::system::error_code& ec) override {
    ReaderScope scope(*this, byte_readers_, max_byte_readers_);
    std::unique_lock<std::mutex> lock(mutex_);
    ++blocked_readers_;
    cv_.wait(lock, [this]() { return !bytes_.empty() || read_error_ || (closed_ && close_unblocks_reads_); });
    --blocked_readers_;
    if (!bytes_.empty()) {
      uint8_t value = bytes_.front();
      bytes_.pop_front();
      ec.clear();
      return value;
    }
    ec = closed_ ? boost::system::error_code(boost::asio::error::bad_descriptor) : *read_error_;
    return 0;
  }

  base::Record read_record(boost::system::error_code& ec) override {
    ReaderScope scope(*this, record_readers_, max_record_readers_);
    std::unique_lock<std::mutex> lock(mutex_);
    ++blocked_readers_;
    cv_.wait(lock, [this]() { return !records_.empty() || read_error_ || (closed_ && close_unblocks_reads_); });
    --blocked_readers_;
    if (!records_.empty()) {
      base::Record record = records_.front();
      records_.pop_front();
      ec.clear();
      return record;
    }
    ec = closed_ ? boost::system::error_code(boost::asio::error::bad_descriptor) : *read_error_;
    return {};
  }

  void write_bytes(const uint8_t* data, size_t size, boost::system::error_code& ec) override {
    if (check_write_error(ec)) return;
    for (size_t i = 0; i < size; ++i) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        wire_.push_back(data[i]);
      }
      std::this_thread::yield();
    }
  }

  void write_record(const base::Record& record, boost::system::error_code& ec) override {
    if (check_write_error(ec)) return;
    const auto frame = transport::record_codec::encode(record);
    write_bytes(frame.data(), frame.size(), ec);
    std::lock_guard<std::mutex> lock(mutex_);
    written_records_.push_back(record);
  }

  void close(boost::system::error_code& ec) override {
    ec.clear();
    close_calls_.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      cv_.notify_all();
    }
    if (throw_on_close_) {
      throw std::runtime_error("close exploded");
    }
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
  }

  base::PeerId remote_peer() const override { return peer_; }

 private:
  // Tracks concurrent readers of one kind and counts reads started after close
  struct ReaderScope {
    ReaderScope(FakeDuplexChannel& ch, std::atomic<size_t>& active, std::atomic<size_t>& max_seen)
        : active_(active) {
      ch.read_calls_.fetch_add(1);
      if (!ch.is_open()) {
        ch.reads_after_close_.fetch_add(1);
      }
      size_t now = active_.fetch_add(1) + 1;
      size_t prev = max_seen.load();
      while (now > prev && !max_seen.compare_exchange_weak(prev, now)) {
      }
    }
    ~ReaderScope() { active_.fetch_sub(1); }
    std::atomic<size_t>& active_;
  };

  bool check_write_error(boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (write_error_) {
      ec = *write_error_;
      return true;
    }
    if (closed_) {
      ec = boost::asio::error::bad_descriptor;
      return true;
    }
    ec.clear();
    return false;
  }

  const base::PeerId peer_;
  const bool close_unblocks_reads_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint8_t> bytes_;
  std::deque<base::Record> records_;
  std::optional<boost::system::error_code> read_error_;
  std::optional<boost::system::error_code> write_error_;
  bool closed_ = false;
  std::atomic<bool> throw_on_close_{false};

  std::vector<uint8_t> wire_;
  std::vector<base::Record> written_records_;

  std::atomic<size_t> read_calls_{0};
  std::atomic<size_t> reads_after_close_{0};
  std::atomic<size_t> byte_readers_{0};
  std::atomic<size_t> record_readers_{0};
  std::atomic<size_t> max_byte_readers_{0};
  std::atomic<size_t> max_record_readers_{0};
  std::atomic<size_t> close_calls_{0};
  std::atomic<int> blocked_readers_{0};
};

}  // namespace test
}  // namespace bluelink
