#include "bluelink/connection/detail/relisten_logic.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>

#include "bluelink/config/connection_config.hpp"
#include "bluelink/config/retry_policy.hpp"
#include "bluelink/diagnostics/error_types.hpp"

using namespace bluelink;
using namespace bluelink::connection::detail;
using namespace std::chrono_literals;

class RelistenLogicTest : public ::testing::Test {
 protected:
  config::ConnectionConfig cfg_;
  diagnostics::ErrorInfo error_info_;

  RelistenLogicTest()
      : error_info_(diagnostics::ErrorLevel::ERROR, diagnostics::ErrorCategory::CONNECTION, "test", "listen", "msg", {},
                    true) {}

  void SetUp() override {
    cfg_.listen_max_retries = -1;  // Unlimited
  }
};

TEST_F(RelistenLogicTest, DisabledByDefault) {
  config::ConnectionConfig defaults;
  auto decision = decide_relisten(defaults, error_info_, 0, std::nullopt);
  EXPECT_FALSE(decision.should_retry);
}

TEST_F(RelistenLogicTest, NonRetryableErrorStopsImmediately) {
  error_info_.retryable = false;
  auto decision = decide_relisten(cfg_, error_info_, 0, std::nullopt);
  EXPECT_FALSE(decision.should_retry);
  EXPECT_FALSE(decision.delay.has_value());
}

TEST_F(RelistenLogicTest, MaxRetriesReachedStops) {
  cfg_.listen_max_retries = 3;
  EXPECT_TRUE(decide_relisten(cfg_, error_info_, 2, std::nullopt).should_retry);
  EXPECT_FALSE(decide_relisten(cfg_, error_info_, 3, std::nullopt).should_retry);
}

TEST_F(RelistenLogicTest, UnlimitedRetriesUseConfiguredInterval) {
  auto decision = decide_relisten(cfg_, error_info_, 500, std::nullopt);
  EXPECT_TRUE(decision.should_retry);
  EXPECT_FALSE(decision.delay.has_value());
}

TEST_F(RelistenLogicTest, PolicyCanRefuse) {
  config::RetryPolicy policy = [](const diagnostics::ErrorInfo&, uint32_t) { return config::RetryDecision{false, 0ms}; };
  auto decision = decide_relisten(cfg_, error_info_, 0, policy);
  EXPECT_FALSE(decision.should_retry);
}

TEST_F(RelistenLogicTest, PolicyDelayIsClamped) {
  config::RetryPolicy too_long = [](const diagnostics::ErrorInfo&, uint32_t) {
    return config::RetryDecision{true, 10min};
  };
  auto decision = decide_relisten(cfg_, error_info_, 0, too_long);
  ASSERT_TRUE(decision.should_retry);
  ASSERT_TRUE(decision.delay.has_value());
  EXPECT_EQ(*decision.delay, MAX_RELISTEN_DELAY);

  config::RetryPolicy negative = [](const diagnostics::ErrorInfo&, uint32_t) {
    return config::RetryDecision{true, -5ms};
  };
  decision = decide_relisten(cfg_, error_info_, 0, negative);
  ASSERT_TRUE(decision.delay.has_value());
  EXPECT_EQ(*decision.delay, 0ms);
}

TEST_F(RelistenLogicTest, FixedIntervalPolicy) {
  auto decision = decide_relisten(cfg_, error_info_, 4, config::FixedInterval(750ms));
  ASSERT_TRUE(decision.should_retry);
  EXPECT_EQ(*decision.delay, 750ms);
}

TEST_F(RelistenLogicTest, ExponentialBackoffWithoutJitterGrows) {
  auto policy = config::ExponentialBackoff(100ms, 1000ms, 2.0, false);
  EXPECT_EQ(*decide_relisten(cfg_, error_info_, 0, policy).delay, 100ms);
  EXPECT_EQ(*decide_relisten(cfg_, error_info_, 1, policy).delay, 200ms);
  EXPECT_EQ(*decide_relisten(cfg_, error_info_, 3, policy).delay, 800ms);
  EXPECT_EQ(*decide_relisten(cfg_, error_info_, 10, policy).delay, 1000ms);
}

TEST_F(RelistenLogicTest, ExponentialBackoffJitterStaysInRange) {
  auto policy = config::ExponentialBackoff(100ms, 400ms, 2.0, true);
  for (uint32_t attempt = 0; attempt < 20; ++attempt) {
    auto decision = decide_relisten(cfg_, error_info_, attempt, policy);
    ASSERT_TRUE(decision.delay.has_value());
    EXPECT_GE(decision.delay->count(), 0);
    EXPECT_LE(decision.delay->count(), 400);
  }
}
