/**
 * @file http_transport.cpp
 * @brief HTTP response helpers
 */

#include "kcenon/media_uploader/request/http_transport.h"
#include "kcenon/media_uploader/core/http_utils.h"

namespace kcenon::media_uploader {

auto http_response::get_header(const std::string& name) const
    -> std::optional<std::string> {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    return http_utils::find_header(headers, name);
}

}  // namespace kcenon::media_uploader
