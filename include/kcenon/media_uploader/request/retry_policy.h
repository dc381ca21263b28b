/**
 * @file retry_policy.h
 * @brief Retry budgets and backoff rules for outgoing requests
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_RETRY_POLICY_H
#define KCENON_MEDIA_UPLOADER_REQUEST_RETRY_POLICY_H

#include "kcenon/media_uploader/core/types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief Retry policy shared by every request of a client
 *
 * The policy is a plain value. Clients keep their own copy and derive a
 * fresh retry_state from it for each logical request, so budgets never
 * leak between requests.
 */
struct retry_policy {
    /// Resubmissions allowed for HTTP 413 responses to POST requests
    uint32_t rate_limit_attempts = 5;

    /// Re-attempts allowed for transient transport failures
    uint32_t request_exception_attempts = 4;

    /// Substrings identifying transient transport failures (case-insensitive)
    std::vector<std::string> qualified_errors = default_qualified_errors();

    /// Fixed part of the transient-failure backoff
    std::chrono::milliseconds backoff_base{1000};

    /// Random part of the transient-failure backoff, drawn from [0, jitter)
    std::chrono::milliseconds backoff_jitter{1000};

    /// Wait used for a 413 response without a retryIn hint
    std::chrono::milliseconds default_rate_limit_wait{60000};

    /// Random extra added to a server supplied retryIn, drawn from [0, jitter)
    std::chrono::milliseconds rate_limit_jitter{1000};

    [[nodiscard]] static auto default_qualified_errors() -> std::vector<std::string>;

    /**
     * @brief Check whether a transport failure message is on the allow-list
     */
    [[nodiscard]] auto qualifies(const std::string& message) const -> bool;

    /**
     * @brief Draw the next transient-failure backoff
     */
    [[nodiscard]] auto next_backoff() const -> std::chrono::milliseconds;

    /**
     * @brief Wait before resubmitting after a 413 response
     * @param body Response body, optionally `{"info":{"retryIn":<seconds>}}`
     */
    [[nodiscard]] auto rate_limit_delay(const std::string& body) const
        -> std::chrono::milliseconds;

    /**
     * @brief Validate the policy
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Server suggested wait in seconds from a 413 body, if any
 */
[[nodiscard]] auto parse_retry_in(const std::string& body) -> std::optional<double>;

/**
 * @brief Remaining budgets of one logical request
 *
 * Budgets only ever decrease.
 */
class retry_state {
public:
    explicit retry_state(const retry_policy& policy)
        : rate_limit_left_(policy.rate_limit_attempts),
          request_exception_left_(policy.request_exception_attempts) {}

    [[nodiscard]] auto rate_limit_attempts_left() const noexcept -> uint32_t {
        return rate_limit_left_;
    }

    [[nodiscard]] auto request_exception_attempts_left() const noexcept -> uint32_t {
        return request_exception_left_;
    }

    /**
     * @brief Spend one rate-limit attempt
     * @return false if the budget was already exhausted
     */
    auto consume_rate_limit_attempt() noexcept -> bool {
        if (rate_limit_left_ == 0) return false;
        --rate_limit_left_;
        return true;
    }

    /**
     * @brief Spend one transient-failure attempt
     * @return false if the budget was already exhausted
     */
    auto consume_request_exception_attempt() noexcept -> bool {
        if (request_exception_left_ == 0) return false;
        --request_exception_left_;
        return true;
    }

private:
    uint32_t rate_limit_left_;
    uint32_t request_exception_left_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_RETRY_POLICY_H
