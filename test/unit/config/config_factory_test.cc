#include "bluelink/config/config_factory.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "bluelink/diagnostics/logger.hpp"
#include "test_utils.hpp"

using namespace bluelink;
using namespace bluelink::config;
using namespace bluelink::test;

class ConfigFactoryTest : public BaseTest {};

TEST_F(ConfigFactoryTest, DefaultsMatchConfigStructs) {
  auto store = ConfigFactory::create_with_defaults();
  auto cfg = ConfigFactory::make_connection_config(*store);
  ConnectionConfig defaults;

  EXPECT_EQ(cfg.service_name, defaults.service_name);
  EXPECT_EQ(cfg.service_uuid, defaults.service_uuid);
  EXPECT_EQ(cfg.auto_listen, defaults.auto_listen);
  EXPECT_EQ(cfg.relisten_after_disconnect, defaults.relisten_after_disconnect);
  EXPECT_EQ(cfg.listen_max_retries, 0);
  EXPECT_EQ(cfg.listen_retry_interval_ms, defaults.listen_retry_interval_ms);
  EXPECT_EQ(cfg.multiplexer.delimiters, (std::vector<uint8_t>{0x0D, 0x0A}));
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_TRUE(store->validate().is_valid);
}

TEST_F(ConfigFactoryTest, ValidatorsGuardRanges) {
  auto store = ConfigFactory::create_with_defaults();
  EXPECT_FALSE(store->set("connection.listen_max_retries", -2).is_valid);
  EXPECT_FALSE(store->set("connection.listen_retry_interval_ms", 10).is_valid);
  EXPECT_FALSE(store->set("connection.service_name", std::string()).is_valid);
  EXPECT_FALSE(store->set("multiplexer.delimiters", std::string("0D,zz")).is_valid);
  EXPECT_FALSE(store->set("logging.level", std::string("verbose")).is_valid);
  EXPECT_TRUE(store->set("connection.listen_max_retries", -1).is_valid);
  EXPECT_TRUE(store->set("multiplexer.delimiters", std::string("3B")).is_valid);
}

TEST_F(ConfigFactoryTest, StoreValuesFlowIntoConnectionConfig) {
  auto store = ConfigFactory::create_with_defaults();
  store->set("connection.service_name", std::string("probe"));
  store->set("connection.auto_listen", false);
  store->set("connection.listen_max_retries", 5);
  store->set("connection.listen_retry_interval_ms", 500);
  store->set("multiplexer.delimiters", std::string("0A"));
  store->set("multiplexer.max_text_length", 128);

  auto cfg = ConfigFactory::make_connection_config(*store);
  EXPECT_EQ(cfg.service_name, "probe");
  EXPECT_FALSE(cfg.auto_listen);
  EXPECT_EQ(cfg.listen_max_retries, 5);
  EXPECT_EQ(cfg.listen_retry_interval_ms, 500u);
  EXPECT_EQ(cfg.multiplexer.delimiters, std::vector<uint8_t>{0x0A});
  EXPECT_EQ(cfg.multiplexer.max_text_length, 128u);
}

TEST_F(ConfigFactoryTest, UnregisteredStoreFallsBackToDefaults) {
  auto store = ConfigFactory::create();
  store->set("connection.auto_listen", std::string("yes"));
  auto cfg = ConfigFactory::make_connection_config(*store);
  EXPECT_TRUE(cfg.auto_listen);
  EXPECT_EQ(cfg.service_name, base::constants::DEFAULT_SERVICE_NAME);
}

TEST_F(ConfigFactoryTest, CreateFromFileOverlaysDefaults) {
  auto path = TestUtils::makeTempFilePath("config_factory_test.conf");
  {
    std::ofstream out(path);
    out << "connection.service_name=logger\n";
    out << "multiplexer.delimiters=0D\n";
  }
  auto store = ConfigFactory::create_from_file(path.string());
  auto cfg = ConfigFactory::make_connection_config(*store);
  EXPECT_EQ(cfg.service_name, "logger");
  EXPECT_EQ(cfg.multiplexer.delimiters, std::vector<uint8_t>{0x0D});
  EXPECT_TRUE(cfg.relisten_after_disconnect);
  TestUtils::removeFileIfExists(path);

  auto missing = ConfigFactory::create_from_file((TestUtils::getTempDirectory() / "missing.conf").string());
  EXPECT_TRUE(missing->has("connection.service_uuid"));
}

TEST_F(ConfigFactoryTest, ApplyLoggingConfig) {
  auto store = ConfigFactory::create_with_defaults();
  store->set("logging.level", std::string("error"));
  store->set("logging.enable_console", false);
  ConfigFactory::apply_logging_config(*store);

  auto& logger = diagnostics::Logger::instance();
  EXPECT_EQ(logger.get_level(), diagnostics::LogLevel::ERROR);
  EXPECT_EQ(logger.get_outputs() & static_cast<int>(diagnostics::LogOutput::CONSOLE), 0);

  logger.set_console_output(true);
  logger.set_level(diagnostics::LogLevel::CRITICAL);
}

TEST(DelimiterFormatTest, ParseAndFormat) {
  auto parsed = delimiter_format::parse("0D, 0a,3B");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, (std::vector<uint8_t>{0x0D, 0x0A, 0x3B}));
  EXPECT_EQ(delimiter_format::format(*parsed), "0D,0A,3B");
  EXPECT_EQ(delimiter_format::format({0x7}), "07");
}

TEST(DelimiterFormatTest, RejectsMalformed) {
  EXPECT_FALSE(delimiter_format::parse("").has_value());
  EXPECT_FALSE(delimiter_format::parse("0D,,0A").has_value());
  EXPECT_FALSE(delimiter_format::parse("100").has_value());
  EXPECT_FALSE(delimiter_format::parse("G1").has_value());
}
