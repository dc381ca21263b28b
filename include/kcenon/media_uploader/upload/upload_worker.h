/**
 * @file upload_worker.h
 * @brief Pausable, cancellable chunk loop for a single upload
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_WORKER_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_WORKER_H

#include "resumable_client.h"
#include "upload_types.h"

#include "kcenon/media_uploader/core/cancellation_token.h"
#include "kcenon/media_uploader/core/types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace kcenon::media_uploader {

class upload_worker;

/**
 * @brief Receives progress and termination reports from workers
 *
 * Called on the worker thread with no worker lock held.
 */
class upload_worker_observer {
public:
    virtual ~upload_worker_observer() = default;

    /**
     * @brief Bytes newly acknowledged by the server
     *
     * Also reported once for the already uploaded prefix of a resumed upload.
     */
    virtual void on_worker_progress(upload_worker& worker, uint64_t bytes) = 0;

    /**
     * @brief The worker reached a terminal state
     * @param outcome completed, failed or cancelled
     * @param err Failure cause when @p outcome is failed
     */
    virtual void on_worker_finished(upload_worker& worker,
                                    upload_state outcome,
                                    const error& err) = 0;
};

/**
 * @brief Drives one upload to completion on its own thread
 *
 * The loop creates or resumes the remote upload, then repeatedly consumes
 * pending commands and sends one chunk at a time until the source is
 * exhausted. Pause and cancel requests are recorded under the worker mutex
 * and acted on at the top of the next iteration, so an in-flight chunk
 * always completes first. A paused worker closes its upload handle and
 * waits on the condition variable until resume() hands it a reopened one.
 *
 * Cancellation also stops the worker's cancellation token, which wakes any
 * retry backoff in progress; the worker then ends as cancelled.
 */
class upload_worker {
public:
    /**
     * @param job Upload to perform; owned by the worker
     * @param client Resumable protocol client
     * @param observer Report sink; may be null, must outlive the worker
     */
    upload_worker(upload_job job, resumable_client client, upload_worker_observer* observer);

    /**
     * @brief Cancels and joins the worker thread
     */
    ~upload_worker();

    upload_worker(const upload_worker&) = delete;
    auto operator=(const upload_worker&) -> upload_worker& = delete;

    /**
     * @brief Launch the worker thread
     * @return error_code::invalid_state_transition if already started or cancelled
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop before the next chunk
     *
     * Repeated requests are accepted.
     * @return error_code::resuming_disabled if the client cannot resume;
     *         error_code::invalid_state_transition once terminal
     */
    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @brief Continue a paused worker from the last acknowledged offset
     *
     * If the worker has not parked yet the pending pause is simply withdrawn.
     * Otherwise the upload handle is reopened by fingerprint on the calling
     * thread before the worker is woken.
     *
     * @return error_code::resuming_disabled or error_code::fingerprint_not_found
     *         (local) or a request error if the handle cannot be reopened;
     *         error_code::invalid_state_transition if the worker is not paused
     */
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Request cancellation; returns without waiting
     */
    void cancel();

    /**
     * @brief Join the worker thread if it was started
     */
    void join();

    /**
     * @brief Block until the worker reaches a terminal state or the timeout passes
     * @return true if terminal
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto state() const -> upload_state;

    /**
     * @brief True when paused or about to pause
     */
    [[nodiscard]] auto is_paused() const -> bool;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

    [[nodiscard]] auto fingerprint() const -> std::string { return job_.fingerprint(); }

    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }

    [[nodiscard]] auto uploaded_bytes() const noexcept -> uint64_t {
        return uploaded_bytes_.load();
    }

    [[nodiscard]] auto upload_url() const -> std::string;

    [[nodiscard]] auto last_error() const -> error;

private:
    void run();
    void finalize(upload_state outcome, error err);
    void report_progress(uint64_t bytes);

    cancellation_token token_;
    upload_job job_;
    resumable_client client_;
    upload_worker_observer* observer_;
    const std::string name_;
    const uint64_t total_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool started_ = false;
    bool pause_requested_ = false;
    bool cancel_requested_ = false;
    bool reopening_ = false;
    std::optional<resumable_uploader> reopened_;
    error last_error_;

    std::atomic<uint64_t> uploaded_bytes_{0};
    std::thread thread_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_WORKER_H
