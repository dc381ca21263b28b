/**
 * @file test_upload_worker.cpp
 * @brief Unit tests for the threaded pause/resume/cancel upload loop
 */

#include <gtest/gtest.h>

#include "support/fake_upload_server.h"
#include "support/test_helpers.h"

#include <kcenon/media_uploader/upload/upload_worker.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::media_uploader::test {

using namespace std::chrono_literals;

namespace {

class recording_observer : public upload_worker_observer {
public:
    void on_worker_progress(upload_worker& worker, uint64_t bytes) override {
        (void)worker;
        std::lock_guard<std::mutex> lock(mutex_);
        progress_total_ += bytes;
        ++progress_calls_;
    }

    void on_worker_finished(upload_worker& worker,
                            upload_state outcome,
                            const error& err) override {
        auto visible = worker.state();
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(outcome);
        states_when_reported_.push_back(visible);
        last_error_ = err;
    }

    [[nodiscard]] auto progress_total() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_total_;
    }

    [[nodiscard]] auto outcomes() const -> std::vector<upload_state> {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_;
    }

    [[nodiscard]] auto states_when_reported() const -> std::vector<upload_state> {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_when_reported_;
    }

    [[nodiscard]] auto last_error() const -> error {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

private:
    mutable std::mutex mutex_;
    uint64_t progress_total_ = 0;
    int progress_calls_ = 0;
    std::vector<upload_state> outcomes_;
    std::vector<upload_state> states_when_reported_;
    error last_error_;
};

}  // namespace

class UploadWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<fake_upload_server>();
        server_->expect_file("clip.mp4");
        payload_ = make_payload(40);
    }

    void TearDown() override {
        server_->open_gate();
        worker_.reset();
    }

    auto make_client(bool resuming = true, retry_policy policy = {}, bool instant_sleep = true)
        -> resumable_client {
        signer_config config;
        config.auth_key = "key-123";
        config.auth_secret = "secret";
        retrying_http_client http(server_, request_signer(config), fake_upload_server::HOST,
                                  policy);
        if (instant_sleep) {
            http = http.with_sleep_function([](std::chrono::milliseconds) { return true; });
        }

        resumable_options options;
        options.endpoint = fake_upload_server::TUS_URL;
        options.chunk_size = 4;
        options.resuming_enabled = resuming;
        return resumable_client(http, std::make_shared<memory_url_store>(), options);
    }

    void make_worker(resumable_client client) {
        auto source = upload_source::from_stream(make_stream(payload_), "clip.mp4");
        ASSERT_TRUE(source);
        upload_job job{source.value(), "file_1", {}};
        worker_ = std::make_unique<upload_worker>(std::move(job), std::move(client), &observer_);
    }

    std::shared_ptr<fake_upload_server> server_;
    recording_observer observer_;
    std::string payload_;
    std::unique_ptr<upload_worker> worker_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(UploadWorkerTest, Completes) {
    make_worker(make_client());
    EXPECT_EQ(worker_->state(), upload_state::created);
    EXPECT_EQ(worker_->name(), "Upload - clip.mp4");
    EXPECT_EQ(worker_->total_bytes(), 40u);

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    EXPECT_EQ(worker_->state(), upload_state::completed);
    EXPECT_EQ(worker_->uploaded_bytes(), 40u);
    EXPECT_EQ(worker_->upload_url(), "https://api.test/resumable/files/1");
    EXPECT_EQ(server_->received("clip.mp4"), payload_);
    EXPECT_EQ(observer_.progress_total(), 40u);
    EXPECT_EQ(observer_.outcomes(), (std::vector<upload_state>{upload_state::completed}));
}

TEST_F(UploadWorkerTest, ReportedBeforeTerminalStateVisible) {
    make_worker(make_client());

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    EXPECT_EQ(observer_.outcomes(), (std::vector<upload_state>{upload_state::completed}));
    EXPECT_EQ(observer_.states_when_reported(),
              (std::vector<upload_state>{upload_state::running}));
    EXPECT_EQ(worker_->state(), upload_state::completed);
}

TEST_F(UploadWorkerTest, FailureReportedBeforeWaitReturns) {
    server_->reject_patches_for("clip.mp4", 500);
    make_worker(make_client());

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    ASSERT_EQ(observer_.outcomes().size(), 1u);
    EXPECT_EQ(observer_.outcomes()[0], upload_state::failed);
    EXPECT_EQ(observer_.last_error().code, error_code::unexpected_status);
    EXPECT_EQ(worker_->last_error().code, error_code::unexpected_status);
}

TEST_F(UploadWorkerTest, StartTwiceRejected) {
    make_worker(make_client());

    ASSERT_TRUE(worker_->start());
    auto again = worker_->start();

    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, error_code::invalid_state_transition);
    ASSERT_TRUE(worker_->wait_for(5s));
}

TEST_F(UploadWorkerTest, CancelBeforeStart) {
    make_worker(make_client());

    worker_->cancel();

    EXPECT_EQ(worker_->state(), upload_state::cancelled);
    EXPECT_FALSE(worker_->start());
    EXPECT_EQ(server_->created_uploads(), 0u);
}

TEST_F(UploadWorkerTest, RejectedChunkFails) {
    server_->reject_patches_for("clip.mp4", 500);
    make_worker(make_client());

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    EXPECT_EQ(worker_->state(), upload_state::failed);
    EXPECT_EQ(worker_->last_error().code, error_code::unexpected_status);
    EXPECT_EQ(observer_.outcomes(), (std::vector<upload_state>{upload_state::failed}));
    EXPECT_EQ(observer_.last_error().code, error_code::unexpected_status);
}

TEST_F(UploadWorkerTest, TransientFailureRetriedTransparently) {
    server_->fail_patches(2, "Connection reset");
    make_worker(make_client());

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    EXPECT_EQ(worker_->state(), upload_state::completed);
    EXPECT_EQ(server_->received("clip.mp4"), payload_);
}

// ============================================================================
// Pause and resume
// ============================================================================

TEST_F(UploadWorkerTest, PauseParksAfterInFlightChunk) {
    make_worker(make_client());
    server_->close_gate();

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));
    ASSERT_TRUE(worker_->pause());
    EXPECT_TRUE(worker_->is_paused());
    server_->open_gate();

    ASSERT_TRUE(wait_until([&] { return worker_->state() == upload_state::paused; }));
    EXPECT_EQ(server_->received("clip.mp4").size(), 4u);
    EXPECT_EQ(worker_->uploaded_bytes(), 4u);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(server_->patch_requests(), 1u);
    EXPECT_EQ(worker_->state(), upload_state::paused);
}

TEST_F(UploadWorkerTest, ResumeContinuesFromServerOffset) {
    make_worker(make_client());
    server_->close_gate();

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));
    ASSERT_TRUE(worker_->pause());
    server_->open_gate();
    ASSERT_TRUE(wait_until([&] { return worker_->state() == upload_state::paused; }));

    ASSERT_TRUE(worker_->resume());
    ASSERT_TRUE(worker_->wait_for(5s));

    EXPECT_EQ(worker_->state(), upload_state::completed);
    EXPECT_EQ(server_->received("clip.mp4"), payload_);
    EXPECT_EQ(server_->head_requests(), 1u);
    EXPECT_EQ(server_->created_uploads(), 1u);

    auto offsets = server_->patch_offsets("clip.mp4");
    ASSERT_EQ(offsets.size(), 10u);
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        EXPECT_EQ(offsets[i], i * 4);
    }
    EXPECT_EQ(observer_.progress_total(), 40u);
}

TEST_F(UploadWorkerTest, ResumeBeforeParkingKeepsHandle) {
    make_worker(make_client());
    server_->close_gate();

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));
    ASSERT_TRUE(worker_->pause());
    ASSERT_TRUE(worker_->resume());
    EXPECT_FALSE(worker_->is_paused());
    server_->open_gate();

    ASSERT_TRUE(worker_->wait_for(5s));
    EXPECT_EQ(worker_->state(), upload_state::completed);
    EXPECT_EQ(server_->head_requests(), 0u);
}

TEST_F(UploadWorkerTest, ResumeWhenNotPausedRejected) {
    make_worker(make_client());
    server_->close_gate();
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));

    auto resumed = worker_->resume();

    ASSERT_FALSE(resumed);
    EXPECT_EQ(resumed.error().code, error_code::invalid_state_transition);
}

TEST_F(UploadWorkerTest, PauseWithResumingDisabled) {
    make_worker(make_client(false));

    auto paused = worker_->pause();
    auto resumed = worker_->resume();

    ASSERT_FALSE(paused);
    EXPECT_EQ(paused.error().code, error_code::resuming_disabled);
    ASSERT_FALSE(resumed);
    EXPECT_EQ(resumed.error().code, error_code::resuming_disabled);
}

TEST_F(UploadWorkerTest, PauseAfterCompletionRejected) {
    make_worker(make_client());
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    auto paused = worker_->pause();

    ASSERT_FALSE(paused);
    EXPECT_EQ(paused.error().code, error_code::invalid_state_transition);
}

TEST_F(UploadWorkerTest, ResumeFailsWhenHandleExpired) {
    make_worker(make_client());
    server_->close_gate();
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));
    ASSERT_TRUE(worker_->pause());
    server_->open_gate();
    ASSERT_TRUE(wait_until([&] { return worker_->state() == upload_state::paused; }));
    server_->expire_upload("clip.mp4");

    auto resumed = worker_->resume();

    ASSERT_FALSE(resumed);
    EXPECT_EQ(resumed.error().code, error_code::upload_handle_unavailable);
    EXPECT_EQ(worker_->state(), upload_state::paused);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(UploadWorkerTest, CancelWhilePaused) {
    make_worker(make_client());
    server_->close_gate();
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));
    ASSERT_TRUE(worker_->pause());
    server_->open_gate();
    ASSERT_TRUE(wait_until([&] { return worker_->state() == upload_state::paused; }));

    worker_->cancel();

    ASSERT_TRUE(worker_->wait_for(5s));
    EXPECT_EQ(worker_->state(), upload_state::cancelled);
    EXPECT_EQ(observer_.outcomes(), (std::vector<upload_state>{upload_state::cancelled}));
}

TEST_F(UploadWorkerTest, CancelInterruptsRetryBackoff) {
    retry_policy slow;
    slow.backoff_base = std::chrono::milliseconds(60000);
    slow.backoff_jitter = std::chrono::milliseconds(0);
    server_->fail_patches(1, "Connection reset by peer");
    make_worker(make_client(true, slow, false));

    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(wait_until([&] {
        for (const auto& request : server_->requests()) {
            if (request.method == http_method::patch) return true;
        }
        return false;
    }));
    std::this_thread::sleep_for(20ms);

    auto start = std::chrono::steady_clock::now();
    worker_->cancel();
    ASSERT_TRUE(worker_->wait_for(5s));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(worker_->state(), upload_state::cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(observer_.outcomes(), (std::vector<upload_state>{upload_state::cancelled}));
    EXPECT_EQ(server_->patch_requests(), 0u);
}

TEST_F(UploadWorkerTest, CancelIsIdempotent) {
    make_worker(make_client());
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(worker_->wait_for(5s));

    worker_->cancel();
    worker_->cancel();

    EXPECT_EQ(worker_->state(), upload_state::completed);
    EXPECT_EQ(observer_.outcomes().size(), 1u);
}

TEST_F(UploadWorkerTest, DestructorStopsRunningWorker) {
    make_worker(make_client());
    server_->close_gate();
    ASSERT_TRUE(worker_->start());
    ASSERT_TRUE(server_->wait_for_blocked(1));

    server_->open_gate();
    worker_.reset();

    auto outcomes = observer_.outcomes();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0] == upload_state::cancelled || outcomes[0] == upload_state::completed);
}

}  // namespace kcenon::media_uploader::test
