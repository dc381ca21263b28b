/**
 * @file upload_types.h
 * @brief Upload job and state definitions
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_TYPES_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_TYPES_H

#include "upload_source.h"

#include <cstdint>
#include <map>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Lifecycle of one upload
 *
 * created -> running <-> paused -> running -> completed;
 * any non-terminal state -> failed or cancelled.
 */
enum class upload_state {
    created,
    running,
    paused,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(upload_state state) -> const char* {
    switch (state) {
        case upload_state::created: return "created";
        case upload_state::running: return "running";
        case upload_state::paused: return "paused";
        case upload_state::completed: return "completed";
        case upload_state::failed: return "failed";
        case upload_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(upload_state state) -> bool {
    return state == upload_state::completed ||
           state == upload_state::failed ||
           state == upload_state::cancelled;
}

/**
 * @brief Check whether a state transition is allowed
 */
[[nodiscard]] constexpr auto is_valid_transition(upload_state from, upload_state to) -> bool {
    switch (from) {
        case upload_state::created:
            return to == upload_state::running || to == upload_state::failed ||
                   to == upload_state::cancelled;
        case upload_state::running:
            return to == upload_state::paused || to == upload_state::completed ||
                   to == upload_state::failed || to == upload_state::cancelled;
        case upload_state::paused:
            return to == upload_state::running || to == upload_state::failed ||
                   to == upload_state::cancelled;
        default:
            return false;
    }
}

/**
 * @brief One file's upload
 */
struct upload_job {
    /// Data to upload
    upload_source source;

    /// Form field the file belongs to
    std::string field_name;

    /// Extra protocol metadata (sent base64 encoded in Upload-Metadata)
    std::map<std::string, std::string> metadata;

    /// Bytes acknowledged by the server
    uint64_t uploaded_bytes = 0;

    /// Current lifecycle state
    upload_state state = upload_state::created;

    /// Upload endpoint URL, assigned once the remote upload exists
    std::string upload_url;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return source.size(); }

    /**
     * @brief Key of the recorded upload URL
     *
     * The source identity qualified by the form field, so two jobs of one
     * batch never share an upload even when their sources look alike.
     */
    [[nodiscard]] auto fingerprint() const -> std::string {
        return source.fingerprint() + "-" + field_name;
    }
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_UPLOAD_TYPES_H
