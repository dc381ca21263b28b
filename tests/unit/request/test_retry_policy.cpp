/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry budgets and backoff computation
 */

#include <gtest/gtest.h>

#include <kcenon/media_uploader/request/retry_policy.h>

#include <chrono>
#include <string>
#include <vector>

namespace kcenon::media_uploader::test {

using std::chrono::milliseconds;

class RetryPolicyTest : public ::testing::Test {};

TEST_F(RetryPolicyTest, Defaults) {
    retry_policy policy;

    EXPECT_EQ(policy.rate_limit_attempts, 5u);
    EXPECT_EQ(policy.request_exception_attempts, 4u);
    EXPECT_EQ(policy.backoff_base, milliseconds(1000));
    EXPECT_EQ(policy.backoff_jitter, milliseconds(1000));
    EXPECT_EQ(policy.default_rate_limit_wait, milliseconds(60000));
    EXPECT_EQ(policy.qualified_errors, retry_policy::default_qualified_errors());
}

TEST_F(RetryPolicyTest, DefaultAllowList) {
    std::vector<std::string> expected{
        "connection reset", "connection refused", "connection closed",
        "timed out", "timeout", "unexpected end of stream",
        "broken pipe", "host not found",
    };

    EXPECT_EQ(retry_policy::default_qualified_errors(), expected);

    retry_policy policy;
    EXPECT_TRUE(policy.qualifies("Connection closed by peer"));
    EXPECT_TRUE(policy.qualifies("read timeout"));
    EXPECT_TRUE(policy.qualifies("Broken pipe"));
    EXPECT_TRUE(policy.qualifies("host not found: api.test"));
    EXPECT_FALSE(policy.qualifies("connection pool exhausted"));
}

TEST_F(RetryPolicyTest, Qualifies_CaseInsensitiveSubstring) {
    retry_policy policy;

    EXPECT_TRUE(policy.qualifies("Connection reset by peer"));
    EXPECT_TRUE(policy.qualifies("read TIMED OUT after 30s"));
    EXPECT_TRUE(policy.qualifies("unexpected end of stream on https://api"));
    EXPECT_FALSE(policy.qualifies("certificate verify failed"));
    EXPECT_FALSE(policy.qualifies(""));
}

TEST_F(RetryPolicyTest, Qualifies_CustomList) {
    retry_policy policy;
    policy.qualified_errors = {"Flaky"};

    EXPECT_TRUE(policy.qualifies("a flaky network"));
    EXPECT_FALSE(policy.qualifies("Connection reset"));
}

TEST_F(RetryPolicyTest, NextBackoff_WithinRange) {
    retry_policy policy;

    for (int i = 0; i < 200; ++i) {
        auto delay = policy.next_backoff();
        EXPECT_GE(delay, milliseconds(1000));
        EXPECT_LT(delay, milliseconds(2000));
    }
}

TEST_F(RetryPolicyTest, NextBackoff_NoJitter) {
    retry_policy policy;
    policy.backoff_base = milliseconds(10);
    policy.backoff_jitter = milliseconds(0);

    EXPECT_EQ(policy.next_backoff(), milliseconds(10));
}

TEST_F(RetryPolicyTest, RateLimitDelay_UsesRetryIn) {
    retry_policy policy;
    std::string body = R"({"error":"RATE_LIMIT_REACHED","info":{"retryIn":2}})";

    for (int i = 0; i < 200; ++i) {
        auto delay = policy.rate_limit_delay(body);
        EXPECT_GE(delay, milliseconds(2000));
        EXPECT_LT(delay, milliseconds(3000));
    }
}

TEST_F(RetryPolicyTest, RateLimitDelay_FractionalRetryIn) {
    retry_policy policy;
    policy.rate_limit_jitter = milliseconds(0);

    EXPECT_EQ(policy.rate_limit_delay(R"({"info":{"retryIn":1.5}})"), milliseconds(1500));
}

TEST_F(RetryPolicyTest, RateLimitDelay_DefaultWithoutHint) {
    retry_policy policy;

    EXPECT_EQ(policy.rate_limit_delay(""), milliseconds(60000));
    EXPECT_EQ(policy.rate_limit_delay(R"({"error":"RATE_LIMIT_REACHED"})"), milliseconds(60000));
    EXPECT_EQ(policy.rate_limit_delay("<html>413</html>"), milliseconds(60000));
}

TEST_F(RetryPolicyTest, ParseRetryIn) {
    EXPECT_EQ(parse_retry_in(R"({"info":{"retryIn":7}})").value_or(-1.0), 7.0);
    EXPECT_EQ(parse_retry_in(R"({"info":{"retryIn":"3"}})").value_or(-1.0), 3.0);
    EXPECT_FALSE(parse_retry_in(R"({"retryIn":7})").has_value());
    EXPECT_FALSE(parse_retry_in(R"({"info":{"retryIn":-1}})").has_value());
    EXPECT_FALSE(parse_retry_in(R"({"info":{"retryIn":"soon"}})").has_value());
}

TEST_F(RetryPolicyTest, Validate) {
    retry_policy policy;
    EXPECT_TRUE(policy.validate());

    policy.backoff_base = milliseconds(-1);
    auto negative = policy.validate();
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, error_code::invalid_configuration);

    retry_policy empty_needle;
    empty_needle.qualified_errors.push_back("");
    EXPECT_FALSE(empty_needle.validate());
}

class RetryStateTest : public ::testing::Test {};

TEST_F(RetryStateTest, BudgetsAreIndependent) {
    retry_policy policy;
    policy.rate_limit_attempts = 1;
    policy.request_exception_attempts = 2;
    retry_state state(policy);

    EXPECT_TRUE(state.consume_request_exception_attempt());
    EXPECT_TRUE(state.consume_request_exception_attempt());
    EXPECT_FALSE(state.consume_request_exception_attempt());
    EXPECT_EQ(state.request_exception_attempts_left(), 0u);

    EXPECT_EQ(state.rate_limit_attempts_left(), 1u);
    EXPECT_TRUE(state.consume_rate_limit_attempt());
    EXPECT_FALSE(state.consume_rate_limit_attempt());
}

}  // namespace kcenon::media_uploader::test
