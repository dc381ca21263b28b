/**
 * @file url_store.h
 * @brief Fingerprint to upload URL storage used for resuming uploads
 */

#ifndef KCENON_MEDIA_UPLOADER_UPLOAD_URL_STORE_H
#define KCENON_MEDIA_UPLOADER_UPLOAD_URL_STORE_H

#include "kcenon/media_uploader/core/types.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::media_uploader {

/**
 * @brief Maps upload fingerprints to remote upload URLs
 *
 * Implementations must be safe for concurrent use.
 */
class url_store {
public:
    virtual ~url_store() = default;

    [[nodiscard]] virtual auto get(const std::string& fingerprint)
        -> std::optional<std::string> = 0;

    [[nodiscard]] virtual auto set(const std::string& fingerprint,
                                   const std::string& url) -> result<void> = 0;

    virtual void remove(const std::string& fingerprint) = 0;
};

/**
 * @brief Process-local URL store
 */
class memory_url_store : public url_store {
public:
    [[nodiscard]] auto get(const std::string& fingerprint)
        -> std::optional<std::string> override;

    [[nodiscard]] auto set(const std::string& fingerprint,
                           const std::string& url) -> result<void> override;

    void remove(const std::string& fingerprint) override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> urls_;
};

/**
 * @brief URL store persisted as one JSON file per fingerprint
 *
 * Lets a later process resume uploads started by an earlier one. Entries
 * are cached in memory after the first lookup.
 */
class file_url_store : public url_store {
public:
    /**
     * @param directory Directory holding the state files; created if missing
     */
    explicit file_url_store(std::filesystem::path directory);
    ~file_url_store() override;

    file_url_store(const file_url_store&) = delete;
    auto operator=(const file_url_store&) -> file_url_store& = delete;

    [[nodiscard]] auto get(const std::string& fingerprint)
        -> std::optional<std::string> override;

    [[nodiscard]] auto set(const std::string& fingerprint,
                           const std::string& url) -> result<void> override;

    void remove(const std::string& fingerprint) override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_UPLOAD_URL_STORE_H
