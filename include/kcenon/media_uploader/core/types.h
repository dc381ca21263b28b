/**
 * @file types.h
 * @brief Core type definitions for media_uploader
 */

#ifndef KCENON_MEDIA_UPLOADER_CORE_TYPES_H
#define KCENON_MEDIA_UPLOADER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_uploader {

/**
 * @brief Error codes for media upload operations
 *
 * Error code ranges:
 * - -100 to -149: Local operation errors (raised on the client side, never retried)
 * - -150 to -199: Request errors (raised at or after the network boundary)
 * - -200 and below: Internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Local operation errors (-100 to -149)
    file_not_found = -100,
    file_read_error = -101,
    file_write_error = -102,
    serialization_failed = -103,
    signing_failed = -104,
    interrupted = -105,
    invalid_state_transition = -106,
    resuming_disabled = -107,
    fingerprint_not_found = -108,
    invalid_configuration = -109,
    upload_cancelled = -110,
    not_initialized = -111,

    // Request errors (-150 to -199)
    request_failed = -150,
    transport_error = -151,
    unexpected_status = -152,
    protocol_error = -153,
    upload_handle_unavailable = -154,
    rate_limited = -155,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::serialization_failed:
            return "serialization failed";
        case error_code::signing_failed:
            return "signing failed";
        case error_code::interrupted:
            return "interrupted";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::resuming_disabled:
            return "resuming disabled";
        case error_code::fingerprint_not_found:
            return "fingerprint not found";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::upload_cancelled:
            return "upload cancelled";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::request_failed:
            return "request failed";
        case error_code::transport_error:
            return "transport error";
        case error_code::unexpected_status:
            return "unexpected status";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::upload_handle_unavailable:
            return "upload handle unavailable";
        case error_code::rate_limited:
            return "rate limited";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether a code belongs to the local operation range
 */
[[nodiscard]] constexpr auto is_local_operation_error(error_code code) -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -100 && value > -150;
}

/**
 * @brief Check whether a code belongs to the request range
 */
[[nodiscard]] constexpr auto is_request_error(error_code code) -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -150 && value > -200;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto is_local_operation() const noexcept -> bool {
        return is_local_operation_error(code);
    }

    [[nodiscard]] auto is_request() const noexcept -> bool {
        return is_request_error(code);
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CORE_TYPES_H
