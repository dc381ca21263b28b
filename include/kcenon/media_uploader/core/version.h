/**
 * @file version.h
 * @brief Library version injected by the build
 *
 * MEDIA_UPLOADER_VERSION_MAJOR/MINOR/PATCH are compile definitions taken
 * from the CMake project version.
 */

#ifndef KCENON_MEDIA_UPLOADER_CORE_VERSION_H
#define KCENON_MEDIA_UPLOADER_CORE_VERSION_H

#include <string>

#if !defined(MEDIA_UPLOADER_VERSION_MAJOR) || !defined(MEDIA_UPLOADER_VERSION_MINOR) || \
    !defined(MEDIA_UPLOADER_VERSION_PATCH)
#error "MEDIA_UPLOADER_VERSION_* must be defined by the build (see CMakeLists.txt)"
#endif

namespace kcenon::media_uploader {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = MEDIA_UPLOADER_VERSION_MAJOR;
    static constexpr int minor = MEDIA_UPLOADER_VERSION_MINOR;
    static constexpr int patch = MEDIA_UPLOADER_VERSION_PATCH;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CORE_VERSION_H
