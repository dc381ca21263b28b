/**
 * @file upload_listener.h
 * @brief Callback surface for batch upload notifications
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_LISTENER_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_LISTENER_H

#include "kcenon/media_uploader/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Receives batch upload notifications
 *
 * Progress, finished and failed must be implemented. The parallel upload
 * notifications are optional and default to no-ops.
 *
 * Callbacks run on worker threads (or the caller's thread for pause and
 * resume notifications) with no library lock held, so they may call back
 * into the coordinator. They must not destroy the coordinator.
 */
class upload_listener {
public:
    virtual ~upload_listener() = default;

    // ========================================================================
    // Required events
    // ========================================================================

    /**
     * @brief Cumulative bytes uploaded across the batch
     */
    virtual void on_progress(uint64_t uploaded_bytes, uint64_t total_bytes) = 0;

    /**
     * @brief Every file was uploaded; fired once
     */
    virtual void on_finished() = 0;

    /**
     * @brief The batch failed; fired once, before the batch is aborted
     */
    virtual void on_failed(const error& err) = 0;

    // ========================================================================
    // Optional events
    // ========================================================================

    /**
     * @brief A worker is being launched
     * @param max_parallel Concurrency limit of the batch
     * @param index Zero-based launch index of the worker
     */
    virtual void on_parallel_uploads_starting(std::size_t max_parallel, std::size_t index) {
        (void)max_parallel;
        (void)index;
    }

    /**
     * @brief A worker accepted a pause request
     */
    virtual void on_parallel_uploads_paused(const std::string& name) { (void)name; }

    /**
     * @brief A worker was resumed
     */
    virtual void on_parallel_uploads_resumed(const std::string& name) { (void)name; }
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_LISTENER_H
