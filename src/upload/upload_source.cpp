/**
 * @file upload_source.cpp
 * @brief Random-access data source for a resumable upload
 */

#include "kcenon/media_uploader/upload/upload_source.h"

#include <algorithm>
#include <fstream>
#include <mutex>

namespace kcenon::media_uploader {

struct upload_source::shared_stream {
    std::shared_ptr<std::istream> stream;
    std::mutex mutex;
};

auto upload_source::from_file(const std::filesystem::path& path) -> result<upload_source> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "file not found: " + path.string()}};
    }

    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    auto size = std::filesystem::file_size(absolute, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
            "failed to stat file: " + path.string() + ": " + ec.message()}};
    }

    auto mtime = std::filesystem::last_write_time(absolute, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
            "failed to stat file: " + path.string() + ": " + ec.message()}};
    }

    auto file = std::make_shared<std::ifstream>(absolute, std::ios::binary);
    if (!*file) {
        return unexpected{error{error_code::file_read_error,
            "failed to open file: " + path.string()}};
    }

    upload_source source;
    source.stream_ = std::make_shared<shared_stream>();
    source.stream_->stream = std::move(file);
    source.path_ = absolute;
    source.name_ = absolute.filename().string();
    source.size_ = size;
    source.fingerprint_ = absolute.string() + "-" + std::to_string(size) + "-" +
                          std::to_string(mtime.time_since_epoch().count());
    return source;
}

auto upload_source::from_stream(std::shared_ptr<std::istream> stream, std::string name)
    -> result<upload_source> {
    if (!stream) {
        return unexpected{error{error_code::file_read_error, "null stream: " + name}};
    }

    stream->clear();
    stream->seekg(0, std::ios::end);
    auto end = stream->tellg();
    stream->seekg(0, std::ios::beg);
    if (end < 0 || !*stream) {
        return unexpected{error{error_code::file_read_error,
            "stream is not seekable: " + name}};
    }

    upload_source source;
    source.stream_ = std::make_shared<shared_stream>();
    source.stream_->stream = std::move(stream);
    source.name_ = std::move(name);
    source.size_ = static_cast<uint64_t>(end);
    source.fingerprint_ = "stream-" + source.name_ + "-" + std::to_string(source.size_);
    return source;
}

auto upload_source::read_at(uint64_t offset, std::size_t max_bytes) const
    -> result<std::vector<uint8_t>> {
    if (offset >= size_ || max_bytes == 0) {
        return std::vector<uint8_t>{};
    }

    auto wanted = static_cast<std::size_t>(
        std::min<uint64_t>(static_cast<uint64_t>(max_bytes), size_ - offset));
    std::vector<uint8_t> buffer(wanted);

    std::lock_guard<std::mutex> lock(stream_->mutex);
    auto& in = *stream_->stream;
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
    auto got = in.gcount();
    if (in.bad() || got <= 0) {
        return unexpected{error{error_code::file_read_error,
            "failed to read " + name_ + " at offset " + std::to_string(offset)}};
    }

    buffer.resize(static_cast<std::size_t>(got));
    return buffer;
}

}  // namespace kcenon::media_uploader
