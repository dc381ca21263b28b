/**
 * @file client_config.cpp
 * @brief Validation of client settings
 */

#include "kcenon/media_uploader/client/client_config.h"

#include "kcenon/media_uploader/core/http_utils.h"

namespace kcenon::media_uploader {

auto client_config::validate() const -> result<void> {
    if (host.empty() || !http_utils::is_absolute_url(host)) {
        return unexpected{error{error_code::invalid_configuration,
            "host must be an absolute http(s) URL"}};
    }

    if (signer.signing_enabled && signer.auth_secret.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "signing is enabled but no auth secret is set"}};
    }

    if (signer.expiry_duration.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "signature expiry must be positive"}};
    }

    if (max_parallel_uploads < 1) {
        return unexpected{error{error_code::invalid_configuration,
            "max_parallel_uploads must be at least 1"}};
    }

    if (chunk_size < MIN_CHUNK_SIZE || chunk_size > MAX_CHUNK_SIZE) {
        return unexpected{error{error_code::invalid_configuration,
            "Chunk size must be between 64KB and 64MB"}};
    }

    if (request_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "request timeout must be positive"}};
    }

    return retry.validate();
}

}  // namespace kcenon::media_uploader
