/**
 * @file retrying_http_client.h
 * @brief Signed HTTP verbs with transient-failure and rate-limit retries
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_RETRYING_HTTP_CLIENT_H
#define KCENON_MEDIA_UPLOADER_REQUEST_RETRYING_HTTP_CLIENT_H

#include "http_transport.h"
#include "request_signer.h"
#include "retry_policy.h"

#include "kcenon/media_uploader/core/cancellation_token.h"
#include "kcenon/media_uploader/core/json_value.h"
#include "kcenon/media_uploader/core/types.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Backoff sleep hook
 * @return false if the sleep was interrupted
 */
using sleep_function = std::function<bool(std::chrono::milliseconds)>;

/**
 * @brief Attachments for a POST request
 */
struct request_attachments {
    /// Form field name to file on disk
    std::map<std::string, std::filesystem::path> files;

    /// Form field name to stream, read from its current position
    std::map<std::string, std::shared_ptr<std::istream>> streams;
};

/**
 * @brief HTTP client that signs payloads and retries transient failures
 *
 * Every logical call owns a fresh retry_state derived from the client's
 * retry_policy:
 * - A transport failure whose message matches the policy allow-list is
 *   retried with the same request after a jittered backoff while the
 *   request-exception budget lasts; otherwise it surfaces as
 *   error_code::request_failed.
 * - A POST answered with HTTP 413 is resubmitted after the server
 *   suggested wait while the rate-limit budget lasts; once exhausted the
 *   413 response itself is returned.
 * - An interrupted backoff surfaces as error_code::interrupted.
 *
 * Copies share the transport and are otherwise independent. The client
 * holds no lock while sleeping.
 *
 * @code
 * retrying_http_client client(transport, signer, "https://api2.transloadit.com");
 * json_value params = json_value::make_object();
 * params["template_id"] = "my-template";
 * auto response = client.post("/assemblies", params);
 * if (response && response.value().status_code == 413) {
 *     // rate-limit budget exhausted
 * }
 * @endcode
 */
class retrying_http_client {
public:
    /**
     * @param transport Transport performing single exchanges
     * @param signer Payload signer
     * @param host Base URL prepended to relative request URLs
     * @param policy Retry policy copied into the client
     */
    retrying_http_client(std::shared_ptr<http_transport_interface> transport,
                         request_signer signer,
                         std::string host,
                         retry_policy policy = {});

    /**
     * @brief Copy of this client using @p sleep for backoff waits
     */
    [[nodiscard]] auto with_sleep_function(sleep_function sleep) const -> retrying_http_client;

    /**
     * @brief Copy of this client whose backoff waits end when @p token stops
     */
    [[nodiscard]] auto with_cancellation(cancellation_token token) const
        -> retrying_http_client;

    // ========================================================================
    // Signed Verbs
    // ========================================================================

    /**
     * @brief GET with the signed payload in the query string
     */
    [[nodiscard]] auto get(const std::string& url,
                           const json_value& params = json_value::make_object())
        -> result<http_response>;

    /**
     * @brief POST a signed multipart payload
     * @param url Absolute or host relative URL
     * @param params Request parameters
     * @param extra_fields Additional string form fields
     * @param attachments Files and streams to attach
     */
    [[nodiscard]] auto post(const std::string& url,
                            const json_value& params = json_value::make_object(),
                            const std::map<std::string, std::string>& extra_fields = {},
                            const request_attachments& attachments = {})
        -> result<http_response>;

    /**
     * @brief PUT a signed multipart payload
     */
    [[nodiscard]] auto put(const std::string& url,
                           const json_value& params = json_value::make_object())
        -> result<http_response>;

    /**
     * @brief DELETE with a signed multipart payload
     */
    [[nodiscard]] auto del(const std::string& url,
                           const json_value& params = json_value::make_object())
        -> result<http_response>;

    // ========================================================================
    // Raw Requests
    // ========================================================================

    /**
     * @brief Send an unsigned request with transient-failure retries only
     *
     * Used by the resumable upload protocol. The client identifier header is
     * added and a relative URL is resolved against the host.
     */
    [[nodiscard]] auto execute(http_request request) -> result<http_response>;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

    [[nodiscard]] auto host() const -> const std::string& { return host_; }

    [[nodiscard]] auto signer() const -> const request_signer& { return signer_; }

    /**
     * @brief Resolve @p url against the host unless it is absolute
     */
    [[nodiscard]] auto resolve(const std::string& url) const -> std::string;

    /**
     * @brief Value of the client identifier header
     */
    [[nodiscard]] static auto client_identifier() -> std::string;

private:
    /// Produces the request for one submission; signed verbs re-sign on each call
    using request_builder = std::function<result<http_request>()>;

    [[nodiscard]] auto send_multipart(http_method method,
                                      const std::string& url,
                                      const json_value& params,
                                      const std::map<std::string, std::string>& extra_fields,
                                      const request_attachments& attachments)
        -> result<http_response>;

    [[nodiscard]] auto send_with_retry(const request_builder& build, bool retry_rate_limit)
        -> result<http_response>;

    [[nodiscard]] auto backoff(std::chrono::milliseconds delay) const -> bool;

    std::shared_ptr<http_transport_interface> transport_;
    request_signer signer_;
    std::string host_;
    retry_policy policy_;
    sleep_function sleep_;
    std::optional<cancellation_token> token_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_RETRYING_HTTP_CLIENT_H
