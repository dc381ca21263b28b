/**
 * @file multipart_form.cpp
 * @brief multipart/form-data body builder
 */

#include "kcenon/media_uploader/request/multipart_form.h"
#include "kcenon/media_uploader/core/http_utils.h"

#include <fstream>
#include <iterator>

namespace kcenon::media_uploader {

namespace {

auto generate_boundary() -> std::string {
    std::string boundary = "----media-uploader-";
    for (int i = 0; i < 4; ++i) {
        boundary += std::to_string(http_utils::random_between(100000, 999999));
    }
    return boundary;
}

auto quote(const std::string& value) -> std::string {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\r' || c == '\n') continue;
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace

multipart_form::multipart_form() : boundary_(generate_boundary()) {}

multipart_form::multipart_form(std::string boundary) : boundary_(std::move(boundary)) {}

void multipart_form::append(const std::string& text) {
    parts_.insert(parts_.end(), text.begin(), text.end());
}

void multipart_form::add_field(const std::string& name, const std::string& value) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=" + quote(name) + "\r\n\r\n");
    append(value);
    append("\r\n");
    ++part_count_;
}

auto multipart_form::add_file(const std::string& name,
                              const std::filesystem::path& path) -> result<void> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "file not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "failed to open file: " + path.string()}};
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
            "failed to read file: " + path.string()}};
    }

    auto filename = path.filename().string();
    add_data(name, filename, http_utils::detect_content_type(filename), data);
    return {};
}

auto multipart_form::add_stream(const std::string& name,
                                std::istream& stream) -> result<void> {
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(stream)),
                              std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return unexpected{error{error_code::file_read_error,
            "failed to read stream part: " + name}};
    }
    add_data(name, name, "application/octet-stream", data);
    return {};
}

void multipart_form::add_data(const std::string& name,
                              const std::string& filename,
                              const std::string& content_type,
                              const std::vector<uint8_t>& data) {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=" + quote(name) +
           "; filename=" + quote(filename) + "\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    parts_.insert(parts_.end(), data.begin(), data.end());
    append("\r\n");
    ++part_count_;
}

auto multipart_form::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_form::body() const -> std::vector<uint8_t> {
    std::vector<uint8_t> out = parts_;
    std::string closing = "--" + boundary_ + "--\r\n";
    out.insert(out.end(), closing.begin(), closing.end());
    return out;
}

}  // namespace kcenon::media_uploader
