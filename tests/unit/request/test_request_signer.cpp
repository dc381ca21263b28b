/**
 * @file test_request_signer.cpp
 * @brief Unit tests for HMAC-SHA1 request signing
 */

#include <gtest/gtest.h>

#include <kcenon/media_uploader/request/request_signer.h>

#include <chrono>
#include <string>

namespace kcenon::media_uploader::test {

namespace {

// 2021-03-04 05:01:07 UTC; five minutes before 2021-03-04 05:06:07
const std::chrono::system_clock::time_point fixed_now{std::chrono::seconds(1614834067)};

}  // namespace

class RequestSignerTest : public ::testing::Test {
protected:
    auto make_config() -> signer_config {
        signer_config config;
        config.auth_key = "key-123";
        config.auth_secret = "secret";
        return config;
    }

    auto make_params() -> json_value {
        json_value params;
        params["template_id"] = "tpl";
        params["steps"]["resize"]["width"] = 320;
        return params;
    }
};

// ============================================================================
// HMAC primitive
// ============================================================================

TEST_F(RequestSignerTest, Hmac_KnownVectors) {
    auto short_vector = request_signer::hmac_sha1_hex("secret", R"({"a":1})");
    ASSERT_TRUE(short_vector);
    EXPECT_EQ(short_vector.value(), "f8446672f033e4b2beafc5ca3a71eafcd2cafb6e");

    auto fox = request_signer::hmac_sha1_hex("key", "The quick brown fox jumps over the lazy dog");
    ASSERT_TRUE(fox);
    EXPECT_EQ(fox.value(), "de7c9b85b8b78aa6bc8a7a36f70a90701c9db4d9");
}

TEST_F(RequestSignerTest, Hmac_LowercaseFortyHexDigits) {
    auto mac = request_signer::hmac_sha1_hex("k", "payload");
    ASSERT_TRUE(mac);
    ASSERT_EQ(mac.value().size(), 40u);
    for (char c : mac.value()) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

// ============================================================================
// Payload construction
// ============================================================================

TEST_F(RequestSignerTest, Sign_MergesAuthBlock) {
    request_signer signer(make_config());

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().expires, "2021/03/04 05:06:07+00:00");
    EXPECT_EQ(payload.value().params_json,
              R"({"auth":{"expires":"2021/03/04 05:06:07+00:00","key":"key-123"},)"
              R"("steps":{"resize":{"width":320}},"template_id":"tpl"})");
}

TEST_F(RequestSignerTest, Sign_SignatureCoversCanonicalJson) {
    request_signer signer(make_config());

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(payload);
    ASSERT_TRUE(payload.value().signature.has_value());
    auto expected = request_signer::hmac_sha1_hex("secret", payload.value().params_json);
    ASSERT_TRUE(expected);
    EXPECT_EQ(*payload.value().signature, expected.value());
}

TEST_F(RequestSignerTest, Sign_Deterministic) {
    request_signer signer(make_config());

    auto first = signer.sign_at(make_params(), fixed_now);
    auto second = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().params_json, second.value().params_json);
    EXPECT_EQ(first.value().signature.value_or(""), second.value().signature.value_or(""));
}

TEST_F(RequestSignerTest, Sign_SensitiveToParamsAndSecret) {
    request_signer signer(make_config());
    auto base = signer.sign_at(make_params(), fixed_now);

    auto params = make_params();
    params["steps"]["resize"]["width"] = 321;
    auto changed_params = signer.sign_at(params, fixed_now);

    auto config = make_config();
    config.auth_secret = "other";
    auto changed_secret = request_signer(config).sign_at(make_params(), fixed_now);

    ASSERT_TRUE(base);
    ASSERT_TRUE(changed_params);
    ASSERT_TRUE(changed_secret);
    EXPECT_NE(base.value().signature.value_or(""), changed_params.value().signature.value_or(""));
    EXPECT_NE(base.value().signature.value_or(""), changed_secret.value().signature.value_or(""));
}

TEST_F(RequestSignerTest, Sign_CallerAuthIsReplaced) {
    request_signer signer(make_config());
    auto params = make_params();
    params["auth"]["key"] = "forged";

    auto payload = signer.sign_at(params, fixed_now);

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().params_json.find("forged"), std::string::npos);
    EXPECT_NE(payload.value().params_json.find(R"("key":"key-123")"), std::string::npos);
}

TEST_F(RequestSignerTest, Sign_NullParamsTreatedAsEmptyObject) {
    request_signer signer(make_config());

    auto payload = signer.sign_at(json_value{}, fixed_now);

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().params_json,
              R"({"auth":{"expires":"2021/03/04 05:06:07+00:00","key":"key-123"}})");
}

TEST_F(RequestSignerTest, Sign_UsesInjectedClock) {
    request_signer signer(make_config(), [] { return fixed_now; });

    auto payload = signer.sign(make_params());

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().expires, "2021/03/04 05:06:07+00:00");
}

TEST_F(RequestSignerTest, Sign_CustomExpiry) {
    auto config = make_config();
    config.expiry_duration = std::chrono::seconds(3600);
    request_signer signer(config);

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().expires, "2021/03/04 06:01:07+00:00");
}

// ============================================================================
// Disabled signing and failures
// ============================================================================

TEST_F(RequestSignerTest, SigningDisabled_NoSignature) {
    auto config = make_config();
    config.signing_enabled = false;
    config.auth_secret.clear();
    request_signer signer(config);

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(payload);
    EXPECT_FALSE(payload.value().signature.has_value());
    EXPECT_NE(payload.value().params_json.find(R"("auth":)"), std::string::npos);

    auto fields = payload.value().to_fields();
    EXPECT_EQ(fields.count("params"), 1u);
    EXPECT_EQ(fields.count("signature"), 0u);
}

TEST_F(RequestSignerTest, EmptySecret_SigningFailed) {
    auto config = make_config();
    config.auth_secret.clear();
    request_signer signer(config);

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_FALSE(payload);
    EXPECT_EQ(payload.error().code, error_code::signing_failed);
    EXPECT_TRUE(payload.error().is_local_operation());
}

TEST_F(RequestSignerTest, NonObjectParams_SerializationFailed) {
    request_signer signer(make_config());

    auto payload = signer.sign_at(json_value("not an object"), fixed_now);

    ASSERT_FALSE(payload);
    EXPECT_EQ(payload.error().code, error_code::serialization_failed);
}

TEST_F(RequestSignerTest, ToFields_IncludesSignature) {
    request_signer signer(make_config());

    auto payload = signer.sign_at(make_params(), fixed_now);

    ASSERT_TRUE(payload);
    auto fields = payload.value().to_fields();
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields["params"], payload.value().params_json);
    EXPECT_EQ(fields["signature"], payload.value().signature.value_or(""));
}

}  // namespace kcenon::media_uploader::test
