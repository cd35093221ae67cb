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

#include "bluelink/concurrency/io_context_manager.hpp"

#include "bluelink/diagnostics/logger.hpp"

namespace bluelink {
namespace concurrency {

IoContextManager::IoContextManager() {
  // Logger must outlive this singleton
  diagnostics::Logger::instance();
}

IoContextManager& IoContextManager::instance() {
  static IoContextManager manager;
  return manager;
}

boost::asio::io_context& IoContextManager::get_context() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ioc_) {
    ioc_ = std::make_shared<IoContext>();
  }
  return *ioc_;
}

void IoContextManager::start() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !stopping_; });

  if (running_.load()) {
    return;
  }

  if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
    BLUELINK_LOG_ERROR("io_context_manager", "start", "Cannot restart IoContextManager from within its own thread.");
    return;
  }

  if (!ioc_) {
    ioc_ = std::make_shared<IoContext>();
  }
  if (ioc_->stopped()) {
    ioc_->restart();
  }
  work_guard_ = std::make_unique<WorkGuard>(ioc_->get_executor());

  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  auto context = ioc_;
  io_thread_ = std::thread([this, context]() {
    BLUELINK_LOG_DEBUG("io_context_manager", "run", "IoContext thread started.");
    try {
      context->run();
    } catch (const std::exception& e) {
      BLUELINK_LOG_ERROR("io_context_manager", "run", "Thread error: " + std::string(e.what()));
    }
    BLUELINK_LOG_DEBUG("io_context_manager", "run", "IoContext thread finished.");
    running_.store(false);
  });
  running_.store(true);
}

void IoContextManager::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load() && !io_thread_.joinable()) {
      return;
    }
    if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
      BLUELINK_LOG_ERROR("io_context_manager", "stop", "Cannot join IoContext thread from within itself.");
      return;
    }

    stopping_ = true;
    work_guard_.reset();
    if (ioc_) {
      ioc_->stop();
    }
    worker = std::move(io_thread_);
  }

  if (worker.joinable()) {
    worker.join();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
    running_.store(false);
  }
  cv_.notify_all();
}

bool IoContextManager::is_running() const { return running_.load(); }

std::unique_ptr<boost::asio::io_context> IoContextManager::create_independent_context() {
  return std::make_unique<IoContext>();
}

IoContextManager::~IoContextManager() { stop(); }

}  // namespace concurrency
}  // namespace bluelink
