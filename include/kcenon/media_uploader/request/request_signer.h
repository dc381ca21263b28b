/**
 * @file request_signer.h
 * @brief Authenticated request payloads signed with HMAC-SHA1
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_REQUEST_SIGNER_H
#define KCENON_MEDIA_UPLOADER_REQUEST_REQUEST_SIGNER_H

#include "kcenon/media_uploader/core/json_value.h"
#include "kcenon/media_uploader/core/types.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Credentials and signing settings
 */
struct signer_config {
    /// Public auth key embedded in every payload
    std::string auth_key;

    /// Secret used for the HMAC; never transmitted
    std::string auth_secret;

    /// Attach a signature to payloads
    bool signing_enabled = true;

    /// Lifetime of a payload (expires = now + duration)
    std::chrono::seconds expiry_duration{300};
};

/**
 * @brief A serialized, optionally signed parameter payload
 *
 * Valid only until @ref expires has passed.
 */
struct signed_payload {
    /// Canonical JSON of params with the auth block merged in
    std::string params_json;

    /// Lowercase hex HMAC-SHA1 of params_json; absent when signing is disabled
    std::optional<std::string> signature;

    /// Expiry timestamp ("yyyy/MM/dd HH:mm:ss+00:00", UTC)
    std::string expires;

    /**
     * @brief Form fields carrying the payload ("params" and, if present, "signature")
     */
    [[nodiscard]] auto to_fields() const -> std::map<std::string, std::string>;
};

/**
 * @brief Builds authenticated request payloads
 *
 * The payload embeds `auth: {key, expires}` into the caller's parameters;
 * any `auth` member supplied by the caller is replaced. The signature is
 * computed over the canonical serialization, so the same parameters,
 * secret and timestamp always give the same signature.
 *
 * @note Immutable after construction and safe for concurrent use.
 */
class request_signer {
public:
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param config Credentials and signing settings
     * @param clock Time source; defaults to the system clock
     */
    explicit request_signer(signer_config config, clock_function clock = nullptr);

    /**
     * @brief Sign parameters using the current time
     */
    [[nodiscard]] auto sign(const json_value& params) const -> result<signed_payload>;

    /**
     * @brief Sign parameters as of a fixed instant
     *
     * @return error_code::signing_failed if the secret is empty while signing
     *         is enabled or the HMAC primitive is unavailable
     */
    [[nodiscard]] auto sign_at(const json_value& params,
                               std::chrono::system_clock::time_point now) const
        -> result<signed_payload>;

    [[nodiscard]] auto config() const -> const signer_config& { return config_; }

    /**
     * @brief Lowercase hex HMAC-SHA1 of @p data keyed with @p key
     */
    [[nodiscard]] static auto hmac_sha1_hex(const std::string& key,
                                            const std::string& data)
        -> result<std::string>;

private:
    signer_config config_;
    clock_function clock_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_REQUEST_SIGNER_H
