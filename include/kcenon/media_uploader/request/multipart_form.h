/**
 * @file multipart_form.h
 * @brief multipart/form-data body builder
 */

#ifndef KCENON_MEDIA_UPLOADER_REQUEST_MULTIPART_FORM_H
#define KCENON_MEDIA_UPLOADER_REQUEST_MULTIPART_FORM_H

#include "kcenon/media_uploader/core/types.h"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief Builds a multipart/form-data request body
 *
 * Parts are emitted in insertion order.
 */
class multipart_form {
public:
    multipart_form();
    explicit multipart_form(std::string boundary);

    /**
     * @brief Add a plain text field
     */
    void add_field(const std::string& name, const std::string& value);

    /**
     * @brief Add a file part, reading the whole file
     *
     * The part content type is derived from the file extension.
     * @return error_code::file_not_found or error_code::file_read_error on failure
     */
    [[nodiscard]] auto add_file(const std::string& name,
                                const std::filesystem::path& path) -> result<void>;

    /**
     * @brief Add a stream part as application/octet-stream
     *
     * Reads @p stream from its current position to the end.
     */
    [[nodiscard]] auto add_stream(const std::string& name,
                                  std::istream& stream) -> result<void>;

    /**
     * @brief Add an in-memory binary part
     */
    void add_data(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  const std::vector<uint8_t>& data);

    /**
     * @brief Value for the Content-Type request header
     */
    [[nodiscard]] auto content_type() const -> std::string;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }

    [[nodiscard]] auto part_count() const noexcept -> std::size_t { return part_count_; }

    /**
     * @brief Serialized body including the closing delimiter
     */
    [[nodiscard]] auto body() const -> std::vector<uint8_t>;

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<uint8_t> parts_;
    std::size_t part_count_ = 0;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_REQUEST_MULTIPART_FORM_H
