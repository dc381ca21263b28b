/**
 * @file upload_source.h
 * @brief Random-access data source for a resumable upload
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_SOURCE_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_SOURCE_H

#include "kcenon/media_uploader/core/types.h"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief Data source of one upload: a file on disk or a seekable stream
 *
 * Copies share the underlying stream; reads are serialized internally.
 */
class upload_source {
public:
    /**
     * @brief Open a file
     * @return error_code::file_not_found or error_code::file_read_error on failure
     */
    [[nodiscard]] static auto from_file(const std::filesystem::path& path)
        -> result<upload_source>;

    /**
     * @brief Wrap a seekable stream
     * @param stream Stream positioned anywhere; its full content is uploaded
     * @param name Name reported as the upload filename
     */
    [[nodiscard]] static auto from_stream(std::shared_ptr<std::istream> stream,
                                          std::string name) -> result<upload_source>;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

    /**
     * @brief Resume lookup key
     *
     * Files: absolute path, size and modification time. Streams: name and size.
     */
    [[nodiscard]] auto fingerprint() const -> const std::string& { return fingerprint_; }

    [[nodiscard]] auto is_file() const noexcept -> bool { return !path_.empty(); }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Read up to @p max_bytes starting at @p offset
     * @return Empty vector at end of data
     */
    [[nodiscard]] auto read_at(uint64_t offset, std::size_t max_bytes) const
        -> result<std::vector<uint8_t>>;

private:
    struct shared_stream;

    upload_source() = default;

    std::shared_ptr<shared_stream> stream_;
    std::filesystem::path path_;
    std::string name_;
    std::string fingerprint_;
    uint64_t size_ = 0;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_SOURCE_H
