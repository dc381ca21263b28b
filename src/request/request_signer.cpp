/**
 * @file request_signer.cpp
 * @brief Authenticated request payloads signed with HMAC-SHA1
 */

#include "kcenon/media_uploader/request/request_signer.h"

#include "kcenon/media_uploader/core/http_utils.h"
#include "kcenon/media_uploader/core/logging.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <vector>

namespace kcenon::media_uploader {

auto signed_payload::to_fields() const -> std::map<std::string, std::string> {
    std::map<std::string, std::string> fields{{"params", params_json}};
    if (signature) {
        fields["signature"] = *signature;
    }
    return fields;
}

request_signer::request_signer(signer_config config, clock_function clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

auto request_signer::sign(const json_value& params) const -> result<signed_payload> {
    return sign_at(params, clock_());
}

auto request_signer::sign_at(const json_value& params,
                             std::chrono::system_clock::time_point now) const
    -> result<signed_payload> {
    if (!params.is_null() && !params.is_object()) {
        return unexpected{error{error_code::serialization_failed,
            "request params must be a JSON object"}};
    }

    signed_payload payload;
    payload.expires = http_utils::format_expiry_time(now + config_.expiry_duration);

    json_value auth = json_value::make_object();
    auth["key"] = config_.auth_key;
    auth["expires"] = payload.expires;

    json_value overlay = json_value::make_object();
    overlay["auth"] = std::move(auth);
    payload.params_json = params.merged(overlay).dump();

    if (!config_.signing_enabled) {
        return payload;
    }

    if (config_.auth_secret.empty()) {
        MU_LOG_ERROR(log_category::signer, "Signing enabled but no auth secret configured");
        return unexpected{error{error_code::signing_failed,
            "signing enabled but auth secret is empty"}};
    }

    auto signature = hmac_sha1_hex(config_.auth_secret, payload.params_json);
    if (!signature) {
        return unexpected{signature.error()};
    }
    payload.signature = std::move(signature.value());
    return payload;
}

auto request_signer::hmac_sha1_hex(const std::string& key,
                                   const std::string& data) -> result<std::string> {
    const EVP_MD* digest = EVP_get_digestbyname("SHA1");
    if (digest == nullptr) {
        return unexpected{error{error_code::signing_failed,
            "HMAC-SHA1 primitive unavailable"}};
    }

    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    auto* out = HMAC(digest,
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                     mac.data(), &mac_len);
    if (out == nullptr) {
        return unexpected{error{error_code::signing_failed, "HMAC computation failed"}};
    }

    mac.resize(mac_len);
    return http_utils::bytes_to_hex(mac);
}

}  // namespace kcenon::media_uploader
