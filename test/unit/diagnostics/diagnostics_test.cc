#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "bluelink/diagnostics/error_handler.hpp"
#include "bluelink/diagnostics/error_mapping.hpp"
#include "bluelink/diagnostics/logger.hpp"
#include "test_utils.hpp"

using namespace bluelink;
using namespace bluelink::diagnostics;
using namespace bluelink::test;

TEST(ErrorMappingTest, ClosedChannelErrors) {
  EXPECT_TRUE(is_channel_closed(boost::asio::error::eof));
  EXPECT_TRUE(is_channel_closed(boost::asio::error::connection_reset));
  EXPECT_TRUE(is_channel_closed(boost::asio::error::bad_descriptor));
  EXPECT_TRUE(is_channel_closed(boost::asio::error::operation_aborted));
  EXPECT_FALSE(is_channel_closed(boost::asio::error::connection_refused));
  EXPECT_FALSE(is_channel_closed(boost::system::errc::make_error_code(boost::system::errc::io_error)));
}

TEST(ErrorMappingTest, ChannelErrorsAreClosedOrTransport) {
  auto closed = classify_channel_error(boost::asio::error::eof, "read_byte");
  EXPECT_EQ(closed.code(), ErrorCode::TransportClosed);
  EXPECT_EQ(closed.cause(), boost::asio::error::eof);

  auto failed = classify_channel_error(boost::system::errc::make_error_code(boost::system::errc::message_size),
                                       "read_record");
  EXPECT_EQ(failed.code(), ErrorCode::TransportError);
  EXPECT_NE(failed.describe().find("read_record"), std::string::npos);
}

TEST(ErrorMappingTest, ConnectErrorCodes) {
  EXPECT_EQ(to_bluelink_error_code({}), ErrorCode::Success);
  EXPECT_EQ(to_bluelink_error_code(boost::asio::error::connection_refused), ErrorCode::ConnectionRefused);
  EXPECT_EQ(to_bluelink_error_code(boost::asio::error::timed_out), ErrorCode::TimedOut);
  EXPECT_EQ(to_bluelink_error_code(boost::asio::error::access_denied), ErrorCode::PermissionDenied);
  EXPECT_EQ(to_bluelink_error_code(boost::asio::error::host_unreachable), ErrorCode::TransportError);
}

TEST(ErrorMappingTest, RetryableListenErrors) {
  EXPECT_FALSE(is_retryable_listen_error({}));
  EXPECT_FALSE(is_retryable_listen_error(boost::asio::error::operation_aborted));
  EXPECT_FALSE(is_retryable_listen_error(boost::asio::error::access_denied));
  EXPECT_TRUE(is_retryable_listen_error(boost::asio::error::address_in_use));
}

TEST(ErrorContextTest, DefaultIsSuccess) {
  ErrorContext ok;
  EXPECT_TRUE(ok.ok());
  ErrorContext bad(ErrorCode::ProxyUnavailable, "Failed to get profile proxy 1");
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.message(), "Failed to get profile proxy 1");
}

class ErrorHandlerTest : public BaseTest {
 protected:
  void TearDown() override {
    auto& handler = ErrorHandler::instance();
    handler.set_enabled(true);
    handler.set_min_error_level(ErrorLevel::INFO);
    handler.clear_callbacks();
    BaseTest::TearDown();
  }
};

TEST_F(ErrorHandlerTest, CountsByLevelAndCategory) {
  error_reporting::report_connection_error("connection_manager", "listen", boost::asio::error::address_in_use);
  error_reporting::report_communication_error("multiplexer", "read_byte", boost::asio::error::eof);
  error_reporting::report_warning("connection_manager", "connect", "Missing permissions");

  auto stats = ErrorHandler::instance().get_error_stats();
  EXPECT_EQ(stats.total_errors, 3u);
  EXPECT_EQ(stats.errors_by_level[static_cast<int>(ErrorLevel::ERROR)], 2u);
  EXPECT_EQ(stats.errors_by_level[static_cast<int>(ErrorLevel::WARNING)], 1u);
  EXPECT_EQ(stats.errors_by_category[static_cast<int>(ErrorCategory::CONNECTION)], 1u);
  EXPECT_EQ(stats.retryable_errors, 1u);

  EXPECT_EQ(ErrorHandler::instance().get_error_count("connection_manager", ErrorLevel::ERROR), 1u);
  EXPECT_EQ(ErrorHandler::instance().get_errors_by_component("multiplexer").size(), 1u);
  EXPECT_EQ(ErrorHandler::instance().get_recent_errors(2).size(), 2u);
}

TEST_F(ErrorHandlerTest, CallbacksReceiveErrors) {
  std::vector<std::string> components;
  ErrorHandler::instance().register_callback([&](const ErrorInfo& info) { components.push_back(info.component); });
  ErrorHandler::instance().register_callback([](const ErrorInfo&) { throw std::runtime_error("callback bug"); });

  error_reporting::report_profile_error("profile_proxy", "request", "Failed to get profile proxy 2");
  ASSERT_EQ(components.size(), 1u);
  EXPECT_EQ(components[0], "profile_proxy");
}

TEST_F(ErrorHandlerTest, MinimumLevelAndDisable) {
  auto& handler = ErrorHandler::instance();
  handler.set_min_error_level(ErrorLevel::ERROR);
  error_reporting::report_info("x", "y", "dropped");
  error_reporting::report_warning("x", "y", "dropped");
  EXPECT_EQ(handler.get_error_stats().total_errors, 0u);

  handler.set_enabled(false);
  error_reporting::report_system_error("x", "y", "dropped");
  EXPECT_EQ(handler.get_error_stats().total_errors, 0u);
}

TEST_F(ErrorHandlerTest, ConcurrentReports) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([]() {
      for (int i = 0; i < 100; ++i) {
        error_reporting::report_communication_error("multiplexer", "write_bytes", boost::asio::error::broken_pipe);
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(ErrorHandler::instance().get_error_stats().total_errors, 400u);
}

TEST(ErrorInfoTest, SummaryMentionsOrigin) {
  ErrorInfo info(ErrorLevel::ERROR, ErrorCategory::CONNECTION, "connection_manager", "listen", "Listen failed",
                 boost::asio::error::address_in_use, true);
  info.retry_count = 2;
  const auto summary = info.get_summary();
  EXPECT_NE(summary.find("[connection_manager]"), std::string::npos);
  EXPECT_NE(summary.find("[listen]"), std::string::npos);
  EXPECT_NE(summary.find("RETRYABLE, count: 2"), std::string::npos);
}

class LoggerTest : public BaseTest {
 protected:
  void TearDown() override {
    auto& logger = Logger::instance();
    logger.set_callback(nullptr);
    logger.set_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
    logger.set_console_output(true);
    logger.set_level(LogLevel::CRITICAL);
    BaseTest::TearDown();
  }
};

TEST_F(LoggerTest, CallbackReceivesFormattedLines) {
  auto& logger = Logger::instance();
  std::vector<std::string> lines;
  logger.set_console_output(false);
  logger.set_level(LogLevel::DEBUG);
  logger.set_format("[{level}] {component}/{operation}: {message}");
  logger.set_callback([&](LogLevel, const std::string& line) { lines.push_back(line); });

  BLUELINK_LOG_INFO("multiplexer", "close", "Closing channel");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "[INFO] multiplexer/close: Closing channel");
}

TEST_F(LoggerTest, LevelFiltersMacros) {
  auto& logger = Logger::instance();
  std::atomic<int> calls{0};
  logger.set_console_output(false);
  logger.set_callback([&](LogLevel, const std::string&) { calls++; });
  logger.set_level(LogLevel::WARNING);

  int evaluated = 0;
  auto message = [&]() {
    evaluated++;
    return std::string("expensive");
  };
  BLUELINK_LOG_DEBUG("test", "filter", message());
  BLUELINK_LOG_INFO("test", "filter", message());
  BLUELINK_LOG_WARNING("test", "filter", message());
  BLUELINK_LOG_ERROR("test", "filter", message());

  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(evaluated, 2);
}

TEST_F(LoggerTest, FileOutput) {
  auto& logger = Logger::instance();
  auto path = TestUtils::makeTempFilePath("logger_test.log");
  TestUtils::removeFileIfExists(path);
  logger.set_console_output(false);
  logger.set_level(LogLevel::INFO);
  logger.set_file_output(path.string());

  BLUELINK_LOG_INFO("socket_channel", "adopt", "written to file");
  logger.flush();
  logger.set_file_output("");

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("written to file"), std::string::npos);
  EXPECT_EQ(logger.get_outputs() & static_cast<int>(LogOutput::FILE), 0);
  TestUtils::removeFileIfExists(path);
}
