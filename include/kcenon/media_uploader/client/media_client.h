/**
 * @file media_client.h
 * @brief Entry point of the media upload client
 */

#ifndef KCENON_MEDIA_UPLOADER_CLIENT_MEDIA_CLIENT_H
#define KCENON_MEDIA_UPLOADER_CLIENT_MEDIA_CLIENT_H

#include "client_config.h"

#include "kcenon/media_uploader/core/types.h"
#include "kcenon/media_uploader/request/retrying_http_client.h"
#include "kcenon/media_uploader/upload/upload_coordinator.h"
#include "kcenon/media_uploader/upload/upload_listener.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Media upload client
 *
 * Owns the configuration, transport, signer and upload URL store, and hands
 * out request clients and batches bound to them.
 *
 * @code
 * auto client = media_client::builder()
 *                   .with_auth("key", "secret")
 *                   .with_max_parallel_uploads(4)
 *                   .build();
 * if (!client) return;
 *
 * auto batch = client.value().new_batch(listener);
 * (void)batch->add_file("/videos/intro.mp4");
 * auto response = batch->save(params);
 * @endcode
 */
class media_client {
public:
    /**
     * @brief Builder for media_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the API host
         * @param host Base URL (default: https://api2.transloadit.com)
         * @return Reference to builder for chaining
         */
        auto with_host(std::string host) -> builder&;

        /**
         * @brief Set credentials
         * @param key Public auth key
         * @param secret Signing secret
         * @return Reference to builder for chaining
         */
        auto with_auth(std::string key, std::string secret) -> builder&;

        /**
         * @brief Enable or disable request signatures
         * @param enable Sign requests (default: true)
         * @return Reference to builder for chaining
         */
        auto with_signing(bool enable) -> builder&;

        /**
         * @brief Set how long signed payloads stay valid
         * @param expiry Duration (default: 300s)
         * @return Reference to builder for chaining
         */
        auto with_signature_expiry(std::chrono::seconds expiry) -> builder&;

        /**
         * @brief Set retry budgets and backoff
         * @return Reference to builder for chaining
         */
        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Set the concurrency limit of new batches
         * @param count At least 1 (default: 1, sequential)
         * @return Reference to builder for chaining
         */
        auto with_max_parallel_uploads(std::size_t count) -> builder&;

        /**
         * @brief Set resumable chunk size
         * @param size Chunk size in bytes, 64KB to 64MB (default: 2MB)
         * @return Reference to builder for chaining
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the per-request timeout of the network transport
         * @return Reference to builder for chaining
         */
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Enable or disable resumable uploads
         * @param enable Record upload URLs and allow pause/resume (default: true)
         * @return Reference to builder for chaining
         */
        auto with_resuming(bool enable) -> builder&;

        /**
         * @brief Use a specific upload URL store
         * @return Reference to builder for chaining
         */
        auto with_url_store(std::shared_ptr<url_store> store) -> builder&;

        /**
         * @brief Use a specific HTTP transport instead of network_system
         * @return Reference to builder for chaining
         */
        auto with_transport(std::shared_ptr<http_transport_interface> transport) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or an error
         */
        [[nodiscard]] auto build() -> result<media_client>;

    private:
        client_config config_;
    };

    // Non-copyable, movable
    media_client(const media_client&) = delete;
    auto operator=(const media_client&) -> media_client& = delete;
    media_client(media_client&&) noexcept;
    auto operator=(media_client&&) noexcept -> media_client&;
    ~media_client();

    /**
     * @brief Signed request client for the configured host
     */
    [[nodiscard]] auto request() const -> retrying_http_client;

    /**
     * @brief New batch using the client's concurrency, chunk and resume settings
     */
    [[nodiscard]] auto new_batch(std::shared_ptr<upload_listener> listener = nullptr) const
        -> std::unique_ptr<upload_coordinator>;

    /**
     * @brief New batch with explicit options
     */
    [[nodiscard]] auto new_batch(std::shared_ptr<upload_listener> listener,
                                 coordinator_options options) const
        -> std::unique_ptr<upload_coordinator>;

    [[nodiscard]] auto config() const -> const client_config&;

    [[nodiscard]] auto store() const -> std::shared_ptr<url_store>;

    /**
     * @brief Value of the client identification header
     */
    [[nodiscard]] static auto client_identifier() -> std::string;

private:
    explicit media_client(client_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CLIENT_MEDIA_CLIENT_H
