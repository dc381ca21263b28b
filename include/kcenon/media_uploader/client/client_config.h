/**
 * @file client_config.h
 * @brief Settings of a media_client
 */

#ifndef KCENON_MEDIA_UPLOADER_CLIENT_CLIENT_CONFIG_H
#define KCENON_MEDIA_UPLOADER_CLIENT_CLIENT_CONFIG_H

#include "kcenon/media_uploader/core/types.h"
#include "kcenon/media_uploader/request/http_transport.h"
#include "kcenon/media_uploader/request/request_signer.h"
#include "kcenon/media_uploader/request/retry_policy.h"
#include "kcenon/media_uploader/upload/url_store.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace kcenon::media_uploader {

/// Default API host
inline constexpr const char* DEFAULT_HOST = "https://api2.transloadit.com";

/// Smallest accepted resumable chunk
inline constexpr std::size_t MIN_CHUNK_SIZE = 64 * 1024;

/// Largest accepted resumable chunk
inline constexpr std::size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

/**
 * @brief Client configuration
 */
struct client_config {
    std::string host = DEFAULT_HOST;
    signer_config signer;
    retry_policy retry;
    std::size_t max_parallel_uploads = 1;
    std::size_t chunk_size = 2 * 1024 * 1024;  // 2MB
    std::chrono::milliseconds request_timeout{30000};
    bool resuming_enabled = true;

    /// Upload URL storage; an in-memory store when null
    std::shared_ptr<url_store> store;

    /// HTTP transport; the network_system transport when null
    std::shared_ptr<http_transport_interface> transport;

    /**
     * @brief Validate the configuration
     * @return error_code::invalid_configuration describing the first problem
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CLIENT_CLIENT_CONFIG_H
