/**
 * @file http_utils.cpp
 * @brief Encoding and parsing helpers shared by the request and upload layers
 */

#include "kcenon/media_uploader/core/http_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>

namespace kcenon::media_uploader::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}  // namespace

auto base64_encode(const std::string& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto url_encode(const std::string& value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto append_query(const std::string& url,
                  const std::map<std::string, std::string>& params) -> std::string {
    if (params.empty()) {
        return url;
    }

    std::string result = url;
    char separator = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : params) {
        result += separator;
        result += url_encode(key);
        result += '=';
        result += url_encode(value);
        separator = '&';
    }
    return result;
}

auto is_absolute_url(const std::string& url) -> bool {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

auto resolve_url(const std::string& base, const std::string& reference) -> std::string {
    if (is_absolute_url(reference)) {
        return reference;
    }

    if (!reference.empty() && reference.front() == '/') {
        auto scheme_end = base.find("://");
        auto authority_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
        auto path_start = base.find('/', authority_start);
        return (path_start == std::string::npos ? base : base.substr(0, path_start)) +
               reference;
    }

    if (!base.empty() && base.back() == '/') {
        return base + reference;
    }
    return base + "/" + reference;
}

// ============================================================================
// JSON Utilities
// ============================================================================

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        std::string value;
        for (auto i = pos + 1; i < json.size(); ++i) {
            char c = json[i];
            if (c == '\\' && i + 1 < json.size()) {
                char next = json[++i];
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    default: value += next; break;
                }
                continue;
            }
            if (c == '"') {
                return value;
            }
            value += c;
        }
        return std::nullopt;
    }

    auto end_pos = json.find_first_of(",}] \t\n\r", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    if (end_pos == pos) {
        return std::nullopt;
    }
    return json.substr(pos, end_pos - pos);
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(const std::string& filename) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
        {".avi", "video/x-msvideo"},
    };

    auto dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos) {
        return "application/octet-stream";
    }

    std::string ext = filename.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

// ============================================================================
// Time and Random Utilities
// ============================================================================

auto format_expiry_time(std::chrono::system_clock::time_point when) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y/%m/%d %H:%M:%S") << "+00:00";
    return oss.str();
}

auto random_between(int64_t min_value, int64_t max_value) -> int64_t {
    if (max_value <= min_value) {
        return min_value;
    }
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dis(min_value, max_value);
    return dis(gen);
}

auto find_header(const std::map<std::string, std::string>& headers,
                 const std::string& name) -> std::optional<std::string> {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace kcenon::media_uploader::http_utils
