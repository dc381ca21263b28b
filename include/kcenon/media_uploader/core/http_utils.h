/**
 * @file http_utils.h
 * @brief Encoding and parsing helpers shared by the request and upload layers
 */

#ifndef KCENON_MEDIA_UPLOADER_CORE_HTTP_UTILS_H
#define KCENON_MEDIA_UPLOADER_CORE_HTTP_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_uploader::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hexadecimal string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Base64 encode string (standard alphabet, padded)
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved set kept as is)
 */
auto url_encode(const std::string& value) -> std::string;

/**
 * @brief Append URL-encoded query parameters to a URL
 * @param url Base URL, may already carry a query string
 * @param params Parameters in key order
 */
auto append_query(const std::string& url,
                  const std::map<std::string, std::string>& params) -> std::string;

/**
 * @brief Check whether a URL carries an http or https scheme
 */
auto is_absolute_url(const std::string& url) -> bool;

/**
 * @brief Resolve a possibly relative reference against a base URL
 *
 * Absolute references are returned unchanged; references starting with '/'
 * replace the path of @p base; anything else is appended to @p base.
 */
auto resolve_url(const std::string& base, const std::string& reference) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Extract a scalar JSON value by key (simple parser for known shapes)
 * @param json JSON document
 * @param key Key to look for; the first occurrence wins
 * @return Unquoted value if found, nullopt otherwise
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Detect MIME content type from a file name extension
 * @return MIME type string (defaults to "application/octet-stream")
 */
auto detect_content_type(const std::string& filename) -> std::string;

// ============================================================================
// Time and Random Utilities
// ============================================================================

/**
 * @brief Format a wall-clock point as "yyyy/MM/dd HH:mm:ss+00:00" in UTC
 */
auto format_expiry_time(std::chrono::system_clock::time_point when) -> std::string;

/**
 * @brief Uniformly distributed integer in [min_value, max_value]
 */
auto random_between(int64_t min_value, int64_t max_value) -> int64_t;

/**
 * @brief Case-insensitive header lookup
 */
auto find_header(const std::map<std::string, std::string>& headers,
                 const std::string& name) -> std::optional<std::string>;

}  // namespace kcenon::media_uploader::http_utils

#endif  // KCENON_MEDIA_UPLOADER_CORE_HTTP_UTILS_H
