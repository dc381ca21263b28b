/**
 * @file url_store.cpp
 * @brief Fingerprint to upload URL storage used for resuming uploads
 */

#include "kcenon/media_uploader/upload/url_store.h"

#include "kcenon/media_uploader/core/http_utils.h"
#include "kcenon/media_uploader/core/json_value.h"
#include "kcenon/media_uploader/core/logging.h"

#include <openssl/evp.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <vector>

namespace kcenon::media_uploader {

// ============================================================================
// memory_url_store
// ============================================================================

auto memory_url_store::get(const std::string& fingerprint) -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = urls_.find(fingerprint);
    if (it == urls_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto memory_url_store::set(const std::string& fingerprint,
                           const std::string& url) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    urls_[fingerprint] = url;
    return {};
}

void memory_url_store::remove(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.erase(fingerprint);
}

auto memory_url_store::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_.size();
}

// ============================================================================
// file_url_store
// ============================================================================

namespace {

auto state_file_name(const std::string& fingerprint) -> std::string {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(fingerprint.data(), fingerprint.size(), digest.data(), &digest_len,
                   EVP_sha1(), nullptr) != 1) {
        // Fall back to an encoded fingerprint when SHA-1 is unavailable
        return http_utils::url_encode(fingerprint) + ".json";
    }
    digest.resize(digest_len);
    return http_utils::bytes_to_hex(digest) + ".json";
}

auto serialize_entry(const std::string& fingerprint, const std::string& url) -> std::string {
    json_value entry = json_value::make_object();
    entry["fingerprint"] = fingerprint;
    entry["upload_url"] = url;
    entry["updated_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return entry.dump();
}

}  // namespace

class file_url_store::impl {
public:
    explicit impl(std::filesystem::path dir) : directory_(std::move(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            MU_LOG_WARN(log_category::resumable,
                "Failed to create URL store directory " + directory_.string() + ": " +
                    ec.message());
        }
    }

    auto get(const std::string& fingerprint) -> std::optional<std::string> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = cache_.find(fingerprint);
            if (it != cache_.end()) {
                return it->second;
            }
        }

        auto path = directory_ / state_file_name(fingerprint);
        std::ifstream file(path);
        if (!file) {
            return std::nullopt;
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        auto json = oss.str();

        auto stored_fingerprint = http_utils::extract_json_value(json, "fingerprint");
        auto url = http_utils::extract_json_value(json, "upload_url");
        if (!stored_fingerprint || *stored_fingerprint != fingerprint || !url || url->empty()) {
            MU_LOG_WARN(log_category::resumable,
                "Ignoring unreadable URL store entry: " + path.string());
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        cache_[fingerprint] = *url;
        return url;
    }

    auto set(const std::string& fingerprint, const std::string& url) -> result<void> {
        std::lock_guard<std::mutex> lock(mutex_);

        auto path = directory_ / state_file_name(fingerprint);
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            MU_LOG_ERROR(log_category::resumable,
                "Failed to open URL store entry for writing: " + path.string());
            return unexpected{error{error_code::file_write_error,
                "failed to open URL store entry for writing"}};
        }

        file << serialize_entry(fingerprint, url);
        if (!file) {
            MU_LOG_ERROR(log_category::resumable,
                "Failed to write URL store entry: " + path.string());
            return unexpected{error{error_code::file_write_error,
                "failed to write URL store entry"}};
        }

        cache_[fingerprint] = url;
        return {};
    }

    void remove(const std::string& fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.erase(fingerprint);

        std::error_code ec;
        std::filesystem::remove(directory_ / state_file_name(fingerprint), ec);
    }

    auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
    std::map<std::string, std::string> cache_;
};

file_url_store::file_url_store(std::filesystem::path directory)
    : impl_(std::make_unique<impl>(std::move(directory))) {}

file_url_store::~file_url_store() = default;

auto file_url_store::get(const std::string& fingerprint) -> std::optional<std::string> {
    return impl_->get(fingerprint);
}

auto file_url_store::set(const std::string& fingerprint,
                         const std::string& url) -> result<void> {
    return impl_->set(fingerprint, url);
}

void file_url_store::remove(const std::string& fingerprint) {
    impl_->remove(fingerprint);
}

auto file_url_store::directory() const -> const std::filesystem::path& {
    return impl_->directory();
}

}  // namespace kcenon::media_uploader
