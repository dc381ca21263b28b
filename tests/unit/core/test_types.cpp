/**
 * @file test_types.cpp
 * @brief Unit tests for error codes and result types
 */

#include <gtest/gtest.h>

#include <kcenon/media_uploader/core/cancellation_token.h>
#include <kcenon/media_uploader/core/types.h>

#include <chrono>
#include <string>
#include <thread>

namespace kcenon::media_uploader::test {

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, LocalOperationRange) {
    EXPECT_TRUE(is_local_operation_error(error_code::file_not_found));
    EXPECT_TRUE(is_local_operation_error(error_code::resuming_disabled));
    EXPECT_TRUE(is_local_operation_error(error_code::fingerprint_not_found));
    EXPECT_TRUE(is_local_operation_error(error_code::invalid_state_transition));
    EXPECT_TRUE(is_local_operation_error(error_code::not_initialized));
    EXPECT_FALSE(is_local_operation_error(error_code::request_failed));
    EXPECT_FALSE(is_local_operation_error(error_code::success));
}

TEST_F(ErrorCodeTest, RequestRange) {
    EXPECT_TRUE(is_request_error(error_code::request_failed));
    EXPECT_TRUE(is_request_error(error_code::transport_error));
    EXPECT_TRUE(is_request_error(error_code::upload_handle_unavailable));
    EXPECT_TRUE(is_request_error(error_code::rate_limited));
    EXPECT_FALSE(is_request_error(error_code::interrupted));
    EXPECT_FALSE(is_request_error(error_code::internal_error));
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::resuming_disabled), "resuming disabled");
    EXPECT_STREQ(to_string(error_code::upload_handle_unavailable), "upload handle unavailable");
}

TEST_F(ErrorCodeTest, ErrorClassification) {
    error local{error_code::signing_failed, "no secret"};
    error request{error_code::unexpected_status, "500"};

    EXPECT_TRUE(local.is_local_operation());
    EXPECT_FALSE(local.is_request());
    EXPECT_TRUE(request.is_request());
    EXPECT_TRUE(static_cast<bool>(request));
    EXPECT_FALSE(static_cast<bool>(error{}));
}

TEST_F(ErrorCodeTest, DefaultMessageFromCode) {
    error err(error_code::protocol_error);
    EXPECT_EQ(err.message, "protocol error");
}

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, ErrorResult) {
    result<std::string> r = unexpected{error{error_code::file_not_found, "missing.mp4"}};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing.mp4");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected{error{error_code::interrupted}};

    EXPECT_TRUE(ok);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::interrupted);
}

class CancellationTokenTest : public ::testing::Test {};

TEST_F(CancellationTokenTest, SleepCompletesWithoutStop) {
    cancellation_token token;
    EXPECT_TRUE(token.sleep_for(std::chrono::milliseconds(5)));
    EXPECT_FALSE(token.stop_requested());
}

TEST_F(CancellationTokenTest, StopWakesSleeper) {
    cancellation_token token;
    auto copy = token;

    auto start = std::chrono::steady_clock::now();
    std::thread stopper([copy] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        copy.request_stop();
    });

    EXPECT_FALSE(token.sleep_for(std::chrono::seconds(10)));
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(token.stop_requested());
}

TEST_F(CancellationTokenTest, StoppedTokenStaysStopped) {
    cancellation_token token;
    token.request_stop();
    EXPECT_FALSE(token.sleep_for(std::chrono::milliseconds(1)));
}

}  // namespace kcenon::media_uploader::test
