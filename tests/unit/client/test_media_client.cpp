/**
 * @file test_media_client.cpp
 * @brief Unit tests for media_client and its builder
 */

#include <gtest/gtest.h>

#include "support/fake_upload_server.h"
#include "support/scripted_transport.h"
#include "support/test_helpers.h"

#include <kcenon/media_uploader/client/media_client.h>
#include <kcenon/media_uploader/core/version.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::media_uploader::test {

using namespace std::chrono_literals;

class MediaClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<scripted_transport>();
    }

    auto base_builder() -> media_client::builder {
        media_client::builder builder;
        builder.with_auth("key-123", "secret").with_transport(transport_);
        return builder;
    }

    std::shared_ptr<scripted_transport> transport_;
};

// ============================================================================
// Builder validation
// ============================================================================

TEST_F(MediaClientTest, Build_Defaults) {
    auto client = base_builder().build();

    ASSERT_TRUE(client) << client.error().message;
    const auto& config = client.value().config();
    EXPECT_EQ(config.host, DEFAULT_HOST);
    EXPECT_EQ(config.max_parallel_uploads, 1u);
    EXPECT_EQ(config.chunk_size, 2u * 1024 * 1024);
    EXPECT_TRUE(config.resuming_enabled);
    EXPECT_TRUE(config.signer.signing_enabled);
    EXPECT_EQ(config.signer.expiry_duration, std::chrono::seconds(300));
    EXPECT_NE(client.value().store(), nullptr);
}

TEST_F(MediaClientTest, Build_RejectsRelativeHost) {
    auto client = base_builder().with_host("api.test").build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_RejectsEmptyHost) {
    auto client = base_builder().with_host("").build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_SigningNeedsSecret) {
    auto client = media_client::builder()
                      .with_auth("key-123", "")
                      .with_transport(transport_)
                      .build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_UnsignedWithoutSecret) {
    auto client = media_client::builder()
                      .with_auth("key-123", "")
                      .with_signing(false)
                      .with_transport(transport_)
                      .build();

    ASSERT_TRUE(client) << client.error().message;
    EXPECT_FALSE(client.value().config().signer.signing_enabled);
}

TEST_F(MediaClientTest, Build_RejectsNonPositiveExpiry) {
    auto client = base_builder().with_signature_expiry(0s).build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_RejectsZeroParallelUploads) {
    auto client = base_builder().with_max_parallel_uploads(0).build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_ChunkSizeBounds) {
    EXPECT_FALSE(base_builder().with_chunk_size(MIN_CHUNK_SIZE - 1).build());
    EXPECT_FALSE(base_builder().with_chunk_size(MAX_CHUNK_SIZE + 1).build());
    EXPECT_TRUE(base_builder().with_chunk_size(MIN_CHUNK_SIZE).build());
    EXPECT_TRUE(base_builder().with_chunk_size(MAX_CHUNK_SIZE).build());
}

TEST_F(MediaClientTest, Build_RejectsNonPositiveTimeout) {
    auto client = base_builder().with_request_timeout(0ms).build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_RejectsInvalidRetryPolicy) {
    retry_policy policy;
    policy.backoff_base = std::chrono::milliseconds(-1);

    auto client = base_builder().with_retry_policy(policy).build();

    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(MediaClientTest, Build_KeepsProvidedStore) {
    auto store = std::make_shared<memory_url_store>();

    auto client = base_builder().with_url_store(store).build();

    ASSERT_TRUE(client);
    EXPECT_EQ(client.value().store(), store);
}

// ============================================================================
// Requests and batches
// ============================================================================

TEST_F(MediaClientTest, Request_UsesConfiguredHostAndPolicy) {
    retry_policy policy;
    policy.rate_limit_attempts = 2;
    auto client = base_builder()
                      .with_host("https://api.test")
                      .with_retry_policy(policy)
                      .build();
    ASSERT_TRUE(client);
    transport_->enqueue_response(200, R"({"ok":"ASSEMBLY_COMPLETED"})");

    auto http = client.value().request();
    auto response = http.get("/assemblies/abc");

    EXPECT_EQ(http.host(), "https://api.test");
    EXPECT_EQ(http.policy().rate_limit_attempts, 2u);
    ASSERT_TRUE(response);
    EXPECT_EQ(response.value().status_code, 200);

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url.rfind("https://api.test/assemblies/abc?", 0), 0u);
    EXPECT_NE(requests[0].url.find("signature="), std::string::npos);
}

TEST_F(MediaClientTest, ClientIdentifier_CarriesVersion) {
    auto identifier = media_client::client_identifier();

    EXPECT_EQ(identifier, "media-uploader-cpp:" + version::to_string());
}

TEST_F(MediaClientTest, NewBatch_InheritsClientSettings) {
    auto client = base_builder()
                      .with_max_parallel_uploads(3)
                      .with_chunk_size(MIN_CHUNK_SIZE)
                      .with_resuming(false)
                      .build();
    ASSERT_TRUE(client);

    auto batch = client.value().new_batch();

    ASSERT_NE(batch, nullptr);
    EXPECT_EQ(batch->options().max_parallel_uploads, 3u);
    EXPECT_EQ(batch->options().chunk_size, MIN_CHUNK_SIZE);
    EXPECT_FALSE(batch->options().resuming_enabled);
    EXPECT_EQ(batch->options().mode, upload_mode::resumable);
    EXPECT_EQ(batch->state(), batch_state::idle);
}

TEST_F(MediaClientTest, NewBatch_ExplicitOptions) {
    auto client = base_builder().build();
    ASSERT_TRUE(client);

    coordinator_options options;
    options.max_parallel_uploads = 5;
    options.mode = upload_mode::multipart;
    auto batch = client.value().new_batch(nullptr, options);

    ASSERT_NE(batch, nullptr);
    EXPECT_EQ(batch->options().max_parallel_uploads, 5u);
    EXPECT_EQ(batch->options().mode, upload_mode::multipart);
}

TEST_F(MediaClientTest, NewBatch_UploadsThroughTransport) {
    auto server = std::make_shared<fake_upload_server>();
    auto listener = std::make_shared<recording_listener>();
    auto client = media_client::builder()
                      .with_host(fake_upload_server::HOST)
                      .with_auth("key-123", "secret")
                      .with_chunk_size(MIN_CHUNK_SIZE)
                      .with_transport(server)
                      .build();
    ASSERT_TRUE(client);

    auto payload = make_payload(MIN_CHUNK_SIZE + 100);
    server->expect_file("poster.png");

    auto batch = client.value().new_batch(listener);
    ASSERT_TRUE(batch->add_stream(make_stream(payload), "poster.png"));
    auto response = batch->save();

    ASSERT_TRUE(response) << response.error().message;
    EXPECT_EQ(response.value().batch_url, fake_upload_server::BATCH_URL);
    EXPECT_EQ(batch->state(), batch_state::finished);
    EXPECT_EQ(server->received("poster.png"), payload);
    EXPECT_EQ(server->patch_offsets("poster.png").size(), 2u);
    EXPECT_EQ(listener->finished_count(), 1);
}

TEST_F(MediaClientTest, MoveKeepsConfiguration) {
    auto client = base_builder().with_max_parallel_uploads(4).build();
    ASSERT_TRUE(client);

    media_client moved = std::move(client.value());

    EXPECT_EQ(moved.config().max_parallel_uploads, 4u);
}

}  // namespace kcenon::media_uploader::test
