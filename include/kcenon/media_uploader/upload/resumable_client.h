/**
 * @file resumable_client.h
 * @brief Client side of the tus 1.0.0 resumable upload protocol
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_RESUMABLE_CLIENT_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_RESUMABLE_CLIENT_H

#include "upload_types.h"
#include "url_store.h"

#include "kcenon/media_uploader/core/cancellation_token.h"
#include "kcenon/media_uploader/core/types.h"
#include "kcenon/media_uploader/request/retrying_http_client.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::media_uploader {

/// Protocol version sent in every Tus-Resumable header
inline constexpr const char* TUS_VERSION = "1.0.0";

/**
 * @brief Settings of the resumable protocol client
 */
struct resumable_options {
    /// Upload creation endpoint (e.g. https://host/resumable/files/)
    std::string endpoint;

    /// Bytes sent per PATCH request
    std::size_t chunk_size = 2 * 1024 * 1024;

    /// Record upload URLs by fingerprint and allow resuming
    bool resuming_enabled = true;
};

/**
 * @brief Handle on one remote upload, advancing it chunk by chunk
 */
class resumable_uploader {
public:
    resumable_uploader(retrying_http_client client,
                       upload_source source,
                       std::string url,
                       uint64_t offset,
                       std::size_t chunk_size);

    /**
     * @brief Send the next chunk
     * @return Bytes acknowledged by the server, or -1 when no data remains
     */
    [[nodiscard]] auto upload_chunk() -> result<int64_t>;

    /**
     * @brief Close the handle; the remote upload stays resumable
     */
    void finish();

    [[nodiscard]] auto offset() const noexcept -> uint64_t { return offset_; }

    [[nodiscard]] auto url() const -> const std::string& { return url_; }

    [[nodiscard]] auto is_finished() const noexcept -> bool { return finished_; }

private:
    retrying_http_client client_;
    upload_source source_;
    std::string url_;
    uint64_t offset_;
    std::size_t chunk_size_;
    bool finished_ = false;
};

/**
 * @brief Creates and resumes remote uploads
 *
 * @code
 * resumable_client tus(http, store, {.endpoint = tus_url});
 * auto uploader = tus.resume_or_create_upload(job);
 * while (uploader) {
 *     auto sent = uploader.value().upload_chunk();
 *     if (!sent || sent.value() < 0) break;
 * }
 * @endcode
 */
class resumable_client {
public:
    resumable_client(retrying_http_client client,
                     std::shared_ptr<url_store> store,
                     resumable_options options);

    /**
     * @brief Copy of this client whose retry backoffs end when @p token stops
     */
    [[nodiscard]] auto with_cancellation(cancellation_token token) const -> resumable_client;

    /**
     * @brief Create a new remote upload (POST, expects 201 + Location)
     */
    [[nodiscard]] auto create_upload(const upload_job& job) -> result<resumable_uploader>;

    /**
     * @brief Reopen a previously created upload by fingerprint (HEAD)
     *
     * @return error_code::resuming_disabled or error_code::fingerprint_not_found
     *         (local), error_code::upload_handle_unavailable when the server no
     *         longer knows the upload, other request errors otherwise
     */
    [[nodiscard]] auto resume_upload(const upload_job& job) -> result<resumable_uploader>;

    /**
     * @brief Resume when possible, otherwise create
     */
    [[nodiscard]] auto resume_or_create_upload(const upload_job& job)
        -> result<resumable_uploader>;

    [[nodiscard]] auto resuming_enabled() const noexcept -> bool {
        return options_.resuming_enabled;
    }

    [[nodiscard]] auto options() const -> const resumable_options& { return options_; }

    /**
     * @brief Upload-Metadata header value for a job
     */
    [[nodiscard]] static auto encode_metadata(const upload_job& job) -> std::string;

private:
    retrying_http_client client_;
    std::shared_ptr<url_store> store_;
    resumable_options options_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_RESUMABLE_CLIENT_H
