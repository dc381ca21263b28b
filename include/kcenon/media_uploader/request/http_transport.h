/**
 * @file http_transport.h
 * @brief HTTP request/response model and transport interface
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_HTTP_TRANSPORT_H
#define KCENON_MEDIA_UPLOADER_REQUEST_HTTP_TRANSPORT_H

#include "kcenon/media_uploader/core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief HTTP methods used by the client
 */
enum class http_method {
    get,
    post,
    put,
    del,
    head,
    patch
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        case http_method::patch: return "PATCH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief A fully prepared HTTP request
 *
 * Retries resend the same request object, so everything needed to repeat
 * the call lives here.
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
};

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by name (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& name) const
        -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Transport interface executing single HTTP exchanges
 *
 * Implementations perform exactly one exchange per call and never retry.
 * A failure to obtain any response is reported as
 * error_code::transport_error whose message describes the I/O failure
 * (for example "connection reset by peer"); the retrying client matches
 * that message against its allow-list.
 */
class http_transport_interface {
public:
    virtual ~http_transport_interface() = default;

    [[nodiscard]] virtual auto send(const http_request& request)
        -> result<http_response> = 0;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_HTTP_TRANSPORT_H
