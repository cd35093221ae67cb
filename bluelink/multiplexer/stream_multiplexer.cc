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

#include "bluelink/multiplexer/stream_multiplexer.hpp"

#include <boost/system/error_code.hpp>

#include "bluelink/concurrency/io_context_manager.hpp"
#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/error_mapping.hpp"
#include "bluelink/diagnostics/logger.hpp"
#include "bluelink/framer/delimiter_framer.hpp"

namespace bluelink {
namespace multiplexer {

using namespace diagnostics;

std::shared_ptr<StreamMultiplexer> StreamMultiplexer::create(std::shared_ptr<interface::DuplexChannel> channel,
                                                             const config::MultiplexerConfig& cfg) {
  auto& manager = concurrency::IoContextManager::instance();
  manager.start();
  return create(std::move(channel), cfg, manager.get_context());
}

std::shared_ptr<StreamMultiplexer> StreamMultiplexer::create(std::shared_ptr<interface::DuplexChannel> channel,
                                                             const config::MultiplexerConfig& cfg,
                                                             boost::asio::io_context& ioc) {
  return std::shared_ptr<StreamMultiplexer>(new StreamMultiplexer(std::move(channel), cfg, ioc));
}

StreamMultiplexer::StreamMultiplexer(std::shared_ptr<interface::DuplexChannel> channel,
                                     const config::MultiplexerConfig& cfg, boost::asio::io_context& ioc)
    : channel_(std::move(channel)), cfg_(cfg), ioc_(ioc), peer_(channel_ ? channel_->remote_peer() : base::PeerId{}) {
  cfg_.validate_and_clamp();
  if (!channel_) {
    closed_.store(true);
    failure_ = ErrorContext(ErrorCode::TransportClosed, "No channel");
  }
}

StreamMultiplexer::~StreamMultiplexer() {
  close();
  // Reader threads hold a reference, so by now they have finished or this is one of them
  join_or_detach(bytes_.worker);
  join_or_detach(records_.worker);
}

StreamMultiplexer::ByteStream StreamMultiplexer::byte_stream() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load()) {
    return dead_stream<uint8_t>();
  }
  if (!bytes_.hub) {
    bytes_.hub = stream::Broadcast<uint8_t>::create(ioc_, cfg_.backpressure_threshold);
  }
  std::weak_ptr<StreamMultiplexer> weak = weak_from_this();
  return ByteStream::from(bytes_.hub, [weak]() {
    if (auto self = weak.lock()) {
      self->start_byte_loop();
    }
  });
}

StreamMultiplexer::TextStream StreamMultiplexer::text_stream() { return text_stream(cfg_.delimiters); }

StreamMultiplexer::TextStream StreamMultiplexer::text_stream(const std::vector<uint8_t>& delimiters) {
  ByteStream bytes = byte_stream();
  const size_t max_length = cfg_.max_text_length;

  return TextStream(ioc_, [bytes, delimiters, max_length](stream::Observer<std::string> downstream,
                                                          stream::Strand strand) {
    // Only touched from this subscription's strand
    auto framer = std::make_shared<framer::DelimiterFramer>(delimiters, max_length);
    framer->set_on_message([on_next = downstream.on_next](const uint8_t* data, size_t size) {
      if (on_next) {
        on_next(base::safe_convert::uint8_to_string(data, size));
      }
    });

    stream::Observer<uint8_t> upstream;
    upstream.on_next = [framer](const uint8_t& value) { framer->push_bytes(&value, 1); };
    upstream.on_error = [framer, on_error = downstream.on_error](const ErrorContext& error) {
      framer->flush();
      if (on_error) {
        on_error(error);
      }
    };
    upstream.on_complete = [framer, on_complete = downstream.on_complete]() {
      framer->flush();
      if (on_complete) {
        on_complete();
      }
    };
    return bytes.subscribe(std::move(upstream), std::move(strand));
  });
}

StreamMultiplexer::RecordStream StreamMultiplexer::record_stream() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load()) {
    return dead_stream<base::Record>();
  }
  if (!records_.hub) {
    records_.hub = stream::Broadcast<base::Record>::create(ioc_, cfg_.backpressure_threshold);
  }
  std::weak_ptr<StreamMultiplexer> weak = weak_from_this();
  return RecordStream::from(records_.hub, [weak]() {
    if (auto self = weak.lock()) {
      self->start_record_loop();
    }
  });
}

bool StreamMultiplexer::send(const std::vector<uint8_t>& bytes) {
  return write("write_bytes",
               [&](boost::system::error_code& ec) { channel_->write_bytes(bytes.data(), bytes.size(), ec); });
}

bool StreamMultiplexer::send(const base::Record& record) {
  return write("write_record", [&](boost::system::error_code& ec) { channel_->write_record(record, ec); });
}

bool StreamMultiplexer::send(std::string_view text) {
  return write("write_text", [&](boost::system::error_code& ec) {
    channel_->write_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size(), ec);
  });
}

void StreamMultiplexer::close() {
  if (closed_.exchange(true)) {
    return;
  }

  std::shared_ptr<stream::Broadcast<uint8_t>> bytes;
  std::shared_ptr<stream::Broadcast<base::Record>> records;
  std::optional<ErrorContext> failure;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes = std::move(bytes_.hub);
    bytes_.hub.reset();
    records = std::move(records_.hub);
    records_.hub.reset();
    failure = failure_;
  }

  BLUELINK_LOG_DEBUG("multiplexer", "close", "Closing channel to " + peer_);
  try {
    boost::system::error_code ec;
    channel_->close(ec);
    if (ec) {
      BLUELINK_LOG_DEBUG("multiplexer", "close", "Ignoring close error: " + ec.message());
    }
  } catch (const std::exception& e) {
    BLUELINK_LOG_DEBUG("multiplexer", "close", "Ignoring exception while closing: " + std::string(e.what()));
  }

  terminate(bytes, failure);
  terminate(records, failure);
}

bool StreamMultiplexer::is_open() const { return !closed_.load(); }

void StreamMultiplexer::start_byte_loop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load() || bytes_.running || !bytes_.hub) {
    return;
  }
  bytes_.running = true;
  loops_started_.fetch_add(1);
  auto self = shared_from_this();
  auto hub = bytes_.hub;
  bytes_.worker = std::thread([self, hub]() { self->run_byte_loop(hub); });
}

void StreamMultiplexer::start_record_loop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load() || records_.running || !records_.hub) {
    return;
  }
  records_.running = true;
  loops_started_.fetch_add(1);
  auto self = shared_from_this();
  auto hub = records_.hub;
  records_.worker = std::thread([self, hub]() { self->run_record_loop(hub); });
}

void StreamMultiplexer::run_byte_loop(std::shared_ptr<stream::Broadcast<uint8_t>> hub) {
  BLUELINK_LOG_DEBUG("multiplexer", "byte_loop", "Byte reader started for " + peer_);
  try {
    while (!closed_.load()) {
      boost::system::error_code ec;
      uint8_t value = channel_->read_byte(ec);
      // A read that was already blocked when close() ran is discarded
      if (closed_.load()) break;
      if (ec) {
        handle_read_failure("read_byte", ec);
        break;
      }
      hub->publish(value);
    }
  } catch (const std::exception& e) {
    BLUELINK_LOG_ERROR("multiplexer", "byte_loop", "Channel threw: " + std::string(e.what()));
    error_reporting::report_system_error("multiplexer", "read_byte", e.what());
    fail(ErrorContext(ErrorCode::TransportError, e.what()));
  }
  BLUELINK_LOG_DEBUG("multiplexer", "byte_loop", "Byte reader stopped for " + peer_);
}

void StreamMultiplexer::run_record_loop(std::shared_ptr<stream::Broadcast<base::Record>> hub) {
  BLUELINK_LOG_DEBUG("multiplexer", "record_loop", "Record reader started for " + peer_);
  try {
    while (!closed_.load()) {
      boost::system::error_code ec;
      base::Record record = channel_->read_record(ec);
      if (closed_.load()) break;
      if (ec) {
        handle_read_failure("read_record", ec);
        break;
      }
      hub->publish(record);
    }
  } catch (const std::exception& e) {
    BLUELINK_LOG_ERROR("multiplexer", "record_loop", "Channel threw: " + std::string(e.what()));
    error_reporting::report_system_error("multiplexer", "read_record", e.what());
    fail(ErrorContext(ErrorCode::TransportError, e.what()));
  }
  BLUELINK_LOG_DEBUG("multiplexer", "record_loop", "Record reader stopped for " + peer_);
}

void StreamMultiplexer::handle_read_failure(const char* operation, const boost::system::error_code& ec) {
  ErrorContext error = classify_channel_error(ec, operation);
  if (error.code() == ErrorCode::TransportClosed) {
    BLUELINK_LOG_INFO("multiplexer", operation, "Channel to " + peer_ + " closed: " + ec.message());
    error_reporting::report_connection_error("multiplexer", operation, ec, false);
  } else {
    BLUELINK_LOG_ERROR("multiplexer", operation, "Read from " + peer_ + " failed: " + ec.message());
    error_reporting::report_communication_error("multiplexer", operation, ec);
  }
  fail(error);
}

bool StreamMultiplexer::write(const char* operation, const std::function<void(boost::system::error_code&)>& op) {
  if (closed_.load()) {
    return false;
  }

  boost::system::error_code ec;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
      return false;
    }
    try {
      op(ec);
    } catch (const std::exception& e) {
      BLUELINK_LOG_ERROR("multiplexer", operation, "Channel threw: " + std::string(e.what()));
      ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
    }
  }

  if (!ec) {
    return true;
  }

  BLUELINK_LOG_WARNING("multiplexer", operation, "Write to " + peer_ + " failed: " + ec.message());
  error_reporting::report_communication_error("multiplexer", operation, ec);
  fail(classify_channel_error(ec, operation));
  return false;
}

void StreamMultiplexer::fail(const ErrorContext& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load()) {
      return;
    }
    if (!failure_) {
      failure_ = error;
    }
  }
  close();
}

template <typename T>
stream::Stream<T> StreamMultiplexer::dead_stream() const {
  if (failure_) {
    return stream::Stream<T>::failed(ioc_, *failure_);
  }
  return stream::Stream<T>::completed(ioc_);
}

template <typename T>
void StreamMultiplexer::terminate(const std::shared_ptr<stream::Broadcast<T>>& hub,
                                  const std::optional<ErrorContext>& failure) {
  if (!hub) {
    return;
  }
  if (failure) {
    hub->fail(*failure);
  } else {
    hub->complete();
  }
}

void StreamMultiplexer::join_or_detach(std::thread& worker) {
  if (!worker.joinable()) {
    return;
  }
  if (worker.get_id() == std::this_thread::get_id()) {
    worker.detach();
  } else {
    worker.join();
  }
}

}  // namespace multiplexer
}  // namespace bluelink
