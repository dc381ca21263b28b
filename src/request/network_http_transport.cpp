/**
 * @file network_http_transport.cpp
 * @brief HTTP transport backed by network_system's HTTP client
 */

#include "kcenon/media_uploader/request/network_http_transport.h"

#include "kcenon/media_uploader/config/feature_flags.h"
#include "kcenon/media_uploader/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::media_uploader {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Response>
    static auto finish(const http_request& request, Response&& response)
        -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::transport_error,
                std::string(to_string(request.method)) + " " + request.url +
                    " failed: " + response.error().message}};
        }
        return convert_response(response.value());
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

// ============================================================================
// HTTP Exchange
// ============================================================================

auto network_http_transport::send(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }

    auto& client = *impl_->client;
    switch (request.method) {
        case http_method::get:
            return impl::finish(request, client.get(request.url, {}, request.headers));
        case http_method::post:
            return impl::finish(request, client.post(request.url, request.body, request.headers));
        case http_method::put:
            return impl::finish(request, client.put(
                request.url, std::string(request.body.begin(), request.body.end()),
                request.headers));
        case http_method::del:
            return impl::finish(request, client.del(request.url, request.headers));
        case http_method::head:
            return impl::finish(request, client.head(request.url, request.headers));
        case http_method::patch: {
            auto headers = request.headers;
            headers["X-HTTP-Method-Override"] = "PATCH";
            return impl::finish(request, client.post(request.url, request.body, headers));
        }
    }
    return unexpected{error{error_code::internal_error, "unsupported HTTP method"}};
#else
    MU_LOG_ERROR(log_category::request,
                 "HTTP transport not available (KCENON_WITH_NETWORK_SYSTEM not defined)");
    return unexpected{error{error_code::transport_error,
        std::string(to_string(request.method)) + " " + request.url +
            " failed: HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_transport::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_transport(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_transport_interface> {
    return std::make_shared<network_http_transport>(timeout);
}

}  // namespace kcenon::media_uploader
