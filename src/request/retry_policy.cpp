/**
 * @file retry_policy.cpp
 * @brief Retry budgets and backoff rules for outgoing requests
 */

#include "kcenon/media_uploader/request/retry_policy.h"

#include "kcenon/media_uploader/core/http_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace kcenon::media_uploader {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto jitter(std::chrono::milliseconds range) -> std::chrono::milliseconds {
    if (range.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(http_utils::random_between(0, range.count() - 1));
}

}  // namespace

auto retry_policy::default_qualified_errors() -> std::vector<std::string> {
    return {
        "connection reset",
        "connection refused",
        "connection closed",
        "timed out",
        "timeout",
        "unexpected end of stream",
        "broken pipe",
        "host not found",
    };
}

auto retry_policy::qualifies(const std::string& message) const -> bool {
    auto haystack = to_lower(message);
    return std::any_of(qualified_errors.begin(), qualified_errors.end(),
                       [&](const std::string& needle) {
                           return !needle.empty() &&
                                  haystack.find(to_lower(needle)) != std::string::npos;
                       });
}

auto retry_policy::next_backoff() const -> std::chrono::milliseconds {
    return backoff_base + jitter(backoff_jitter);
}

auto retry_policy::rate_limit_delay(const std::string& body) const
    -> std::chrono::milliseconds {
    auto retry_in = parse_retry_in(body);
    if (!retry_in) {
        return default_rate_limit_wait;
    }
    auto base = std::chrono::milliseconds(static_cast<int64_t>(std::llround(*retry_in * 1000.0)));
    return base + jitter(rate_limit_jitter);
}

auto retry_policy::validate() const -> result<void> {
    if (backoff_base.count() < 0 || backoff_jitter.count() < 0 ||
        default_rate_limit_wait.count() < 0 || rate_limit_jitter.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
            "retry delays must not be negative"}};
    }
    if (std::any_of(qualified_errors.begin(), qualified_errors.end(),
                    [](const std::string& s) { return s.empty(); })) {
        return unexpected{error{error_code::invalid_configuration,
            "qualified error substrings must not be empty"}};
    }
    return {};
}

auto parse_retry_in(const std::string& body) -> std::optional<double> {
    auto info_pos = body.find("\"info\"");
    if (info_pos == std::string::npos) {
        return std::nullopt;
    }

    auto value = http_utils::extract_json_value(body.substr(info_pos), "retryIn");
    if (!value || value->empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double seconds = std::strtod(value->c_str(), &end);
    if (end == value->c_str() || !std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    return seconds;
}

}  // namespace kcenon::media_uploader
