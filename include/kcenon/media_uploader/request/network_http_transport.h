/**
 * @file network_http_transport.h
 * @brief HTTP transport backed by network_system's HTTP client
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_NETWORK_HTTP_TRANSPORT_H
#define KCENON_MEDIA_UPLOADER_REQUEST_NETWORK_HTTP_TRANSPORT_H

#include "http_transport.h"

#include <chrono>
#include <memory>

namespace kcenon::media_uploader {

/**
 * @brief Transport wrapping kcenon::network::core::http_client
 *
 * PATCH requests are sent as POST with an `X-HTTP-Method-Override: PATCH`
 * header since the underlying client has no PATCH verb.
 *
 * When the library is built without network_system every request fails
 * with error_code::transport_error.
 *
 * @note Safe for concurrent use.
 */
class network_http_transport : public http_transport_interface {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    [[nodiscard]] auto send(const http_request& request) -> result<http_response> override;

    /**
     * @brief Check if the network client is available
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the default transport
 */
[[nodiscard]] auto make_network_http_transport(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_transport_interface>;

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_NETWORK_HTTP_TRANSPORT_H
