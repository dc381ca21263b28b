/**
 * @file upload_coordinator.h
 * @brief Batch upload with a bounded pool of concurrent workers
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_COORDINATOR_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_COORDINATOR_H

#include "upload_listener.h"
#include "upload_source.h"
#include "upload_worker.h"
#include "url_store.h"

#include "kcenon/media_uploader/core/json_value.h"
#include "kcenon/media_uploader/core/types.h"
#include "kcenon/media_uploader/request/retrying_http_client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief How files reach the server
 */
enum class upload_mode {
    resumable,  ///< One chunked resumable upload per file
    multipart   ///< Every file attached to the batch creation request
};

/**
 * @brief Batch lifecycle
 */
enum class batch_state {
    idle,
    uploading,
    finished,
    failed,
    aborted
};

[[nodiscard]] constexpr auto to_string(batch_state state) -> const char* {
    switch (state) {
        case batch_state::idle: return "idle";
        case batch_state::uploading: return "uploading";
        case batch_state::finished: return "finished";
        case batch_state::failed: return "failed";
        case batch_state::aborted: return "aborted";
        default: return "unknown";
    }
}

/**
 * @brief Batch settings
 */
struct coordinator_options {
    /// Upper bound on concurrently uploading files; 1 makes save() blocking
    std::size_t max_parallel_uploads = 1;

    /// Bytes per resumable chunk
    std::size_t chunk_size = 2 * 1024 * 1024;

    /// Record upload URLs and allow pause/resume
    bool resuming_enabled = true;

    /// Batch creation endpoint, relative to the client host
    std::string batch_endpoint = "/assemblies";

    upload_mode mode = upload_mode::resumable;
};

/**
 * @brief Response of the batch creation request
 */
struct batch_response {
    int status_code = 0;
    std::string body;

    /// Status URL of the batch (assembly_ssl_url, else assembly_url)
    std::string batch_url;

    /// Resumable upload endpoint announced by the server
    std::string tus_url;
};

/**
 * @brief Snapshot of batch progress
 */
struct batch_progress {
    uint64_t uploaded_bytes = 0;
    uint64_t total_bytes = 0;
    std::size_t total_files = 0;
    std::size_t completed_files = 0;
    std::size_t active_workers = 0;

    /// Active workers parked by a pause
    std::size_t paused_workers = 0;

    std::size_t queued_workers = 0;
    batch_state state = batch_state::idle;
};

/**
 * @brief Uploads a set of files as one batch
 *
 * save() creates the remote batch, then launches at most
 * max_parallel_uploads workers and queues the rest; each completed worker
 * hands its slot to the next queued one. The first worker failure fires
 * upload_listener::on_failed once and aborts the batch.
 *
 * @code
 * auto batch = client.new_batch(listener, {.max_parallel_uploads = 4});
 * batch->add_file("a.mp4");
 * batch->add_file("b.mp4");
 * auto response = batch->save(params);
 * batch->wait();
 * @endcode
 *
 * @note Not copyable or movable; workers refer back to the coordinator.
 *       Destroying it aborts the batch and joins every worker thread.
 */
class upload_coordinator : private upload_worker_observer {
public:
    upload_coordinator(retrying_http_client client,
                       std::shared_ptr<url_store> store,
                       coordinator_options options,
                       std::shared_ptr<upload_listener> listener = nullptr);

    ~upload_coordinator() override;

    upload_coordinator(const upload_coordinator&) = delete;
    auto operator=(const upload_coordinator&) -> upload_coordinator& = delete;

    // ========================================================================
    // Batch Setup
    // ========================================================================

    /**
     * @brief Add a file to the batch
     * @param field_name Form field name; "file_<n>" when empty
     * @return error_code::invalid_configuration if the field is already used
     */
    [[nodiscard]] auto add_file(const std::filesystem::path& path,
                                const std::string& field_name = "") -> result<void>;

    /**
     * @brief Add a seekable stream to the batch
     */
    [[nodiscard]] auto add_stream(std::shared_ptr<std::istream> stream,
                                  const std::string& name,
                                  const std::string& field_name = "") -> result<void>;

    void set_listener(std::shared_ptr<upload_listener> listener);

    // ========================================================================
    // Batch Control
    // ========================================================================

    /**
     * @brief Create the remote batch and start uploading
     *
     * Returns once workers are launched, or after every upload ended when
     * max_parallel_uploads is 1.
     *
     * @return error_code::invalid_state_transition if already saved;
     *         request errors from batch creation; in blocking mode the batch
     *         failure, or error_code::upload_cancelled after an abort
     */
    [[nodiscard]] auto save(const json_value& params = json_value::make_object(),
                            const std::map<std::string, std::string>& extra_fields = {})
        -> result<batch_response>;

    /**
     * @brief Pause every active worker before its next chunk
     *
     * Workers launched while paused park before their first chunk.
     * @return error_code::resuming_disabled when resuming is off
     */
    [[nodiscard]] auto pause_uploads() -> result<void>;

    /**
     * @brief Resume every paused worker from its last acknowledged offset
     * @return First worker error; remaining workers are still resumed
     */
    [[nodiscard]] auto resume_uploads() -> result<void>;

    /**
     * @brief Cancel active workers and discard queued ones; idempotent
     */
    void abort_uploads();

    /**
     * @brief Block until the batch is finished, failed or aborted
     *
     * Returns immediately if save() was never called.
     */
    auto wait() -> batch_state;

    /**
     * @return true if the batch reached a terminal outcome in time
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    // ========================================================================
    // Status
    // ========================================================================

    [[nodiscard]] auto state() const -> batch_state;

    [[nodiscard]] auto progress() const -> batch_progress;

    [[nodiscard]] auto active_worker_count() const -> std::size_t;

    [[nodiscard]] auto queued_count() const -> std::size_t;

    [[nodiscard]] auto file_count() const -> std::size_t;

    /**
     * @brief Error that failed the batch, if any
     */
    [[nodiscard]] auto last_error() const -> std::optional<error>;

    [[nodiscard]] auto options() const -> const coordinator_options& { return options_; }

private:
    struct pending_file {
        upload_source source;
        std::shared_ptr<std::istream> stream;
        std::string field_name;
    };

    struct launch_notice {
        upload_worker* worker;
        std::size_t index;
    };

    void on_worker_progress(upload_worker& worker, uint64_t bytes) override;
    void on_worker_finished(upload_worker& worker,
                            upload_state outcome,
                            const error& err) override;

    [[nodiscard]] auto save_multipart(const json_value& params,
                                      const std::map<std::string, std::string>& extra_fields)
        -> result<batch_response>;

    [[nodiscard]] auto next_field_name() -> std::string;

    [[nodiscard]] auto add_source_locked(upload_source source,
                                         std::shared_ptr<std::istream> stream,
                                         const std::string& field_name) -> result<void>;

    auto launch_queued_locked() -> std::vector<launch_notice>;
    void abort_locked();
    void notify_launches(const std::vector<launch_notice>& launches);
    void mark_settled();
    [[nodiscard]] auto current_listener() const -> std::shared_ptr<upload_listener>;

    retrying_http_client client_;
    std::shared_ptr<url_store> store_;
    const coordinator_options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<upload_listener> listener_;
    std::vector<pending_file> files_;
    std::deque<std::unique_ptr<upload_worker>> queue_;
    std::vector<std::unique_ptr<upload_worker>> active_;
    std::vector<std::unique_ptr<upload_worker>> retired_;
    batch_state state_ = batch_state::idle;
    bool paused_ = false;
    bool settled_ = false;
    std::size_t launched_ = 0;
    std::size_t completed_ = 0;
    std::optional<error> last_error_;

    std::atomic<uint64_t> uploaded_bytes_{0};
    uint64_t total_bytes_ = 0;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_COORDINATOR_H
