// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for media_uploader
 *
 * Messages are routed to logger_system when the library is built with
 * BUILD_WITH_LOGGER_SYSTEM and BUILD_WITH_COMMON_SYSTEM, otherwise they are
 * written to stderr. Either way an optional callback sees every record.
 */

#pragma once

#include "kcenon/media_uploader/config/feature_flags.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::media_uploader {

/**
 * @brief Log categories for media_uploader
 */
struct log_category {
    static constexpr std::string_view client = "media_uploader.client";
    static constexpr std::string_view request = "media_uploader.request";
    static constexpr std::string_view signer = "media_uploader.signer";
    static constexpr std::string_view resumable = "media_uploader.resumable";
    static constexpr std::string_view worker = "media_uploader.worker";
    static constexpr std::string_view coordinator = "media_uploader.coordinator";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

[[nodiscard]] inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for credential masking
 */
struct masking_config {
    bool mask_signatures = true;
    bool mask_auth_keys = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, '*', 4};
    }
};

/**
 * @brief Masks request signatures and auth keys in log messages
 *
 * Signatures appear as 40 hex digit HMAC-SHA1 values (either bare or as a
 * `signature=` query parameter); auth keys appear as `"key":"..."` inside
 * serialized params.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_signatures) {
            static const std::regex signature_pattern(R"(\b[0-9a-fA-F]{40}\b)");
            out = replace_all(out, signature_pattern, 0);
        }
        if (config_.mask_auth_keys) {
            static const std::regex key_pattern(R"("key"\s*:\s*"([^"]*)\")");
            out = replace_all(out, key_pattern, 1);
        }
        return out;
    }

    [[nodiscard]] auto mask_value(const std::string& value) const -> std::string {
        if (value.size() <= config_.visible_chars) {
            return std::string(value.size(), config_.mask_char);
        }
        return value.substr(0, config_.visible_chars) +
               std::string(value.size() - config_.visible_chars, config_.mask_char);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    [[nodiscard]] auto replace_all(const std::string& input,
                                   const std::regex& pattern,
                                   std::size_t group) const -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            auto pos = static_cast<std::size_t>(match.position(group));
            auto len = static_cast<std::size_t>(match.length(group));
            result += input.substr(last_pos, pos - last_pos);
            result += mask_value(match.str(group));
            last_pos = pos + len;
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to upload log records
 */
struct upload_log_context {
    std::string fingerprint;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> offset;
    std::optional<uint64_t> chunk_bytes;
    std::optional<uint32_t> attempts_left;
    std::optional<int> status_code;
    std::optional<uint64_t> delay_ms;
    std::optional<std::string> url;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_string = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!fingerprint.empty()) add_string("fingerprint", fingerprint);
        if (!filename.empty()) add_string("filename", filename);
        if (file_size) add_number("size", static_cast<int64_t>(*file_size));
        if (offset) add_number("offset", static_cast<int64_t>(*offset));
        if (chunk_bytes) add_number("chunk_bytes", static_cast<int64_t>(*chunk_bytes));
        if (attempts_left) add_number("attempts_left", *attempts_left);
        if (status_code) add_number("status", *status_code);
        if (delay_ms) add_number("delay_ms", static_cast<int64_t>(*delay_ms));
        if (url) add_string("url", masker ? masker->mask(*url) : *url);
        if (error_message) {
            add_string("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per record
};

/**
 * @brief Logger used throughout media_uploader
 */
class media_uploader_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    media_uploader_logger() = default;
    ~media_uploader_logger() = default;

    media_uploader_logger(const media_uploader_logger&) = delete;
    media_uploader_logger& operator=(const media_uploader_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by media_client::builder::build().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(config_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback that receives every record above the level
     *
     * The callback sees the unmasked message; pass nullptr to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string record = (format == log_output_format::json)
            ? format_json(level, category, message, context, file, line, function, masker)
            : format_text(category, message, context, masker);

#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            record = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                     record;
        }
        output_to_stderr(record);
    }

    void flush() {
#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const char* file,
                            int line,
                            const char* function,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << detail::escape_json_string(masker.mask(std::string(message))) << "\"";

        if (context) {
            auto ctx_json = context->to_json(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (line > 0) oss << ",\"line\":" << line;
            if (function) oss << ",\"function\":\"" << function << "\"";
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

#if MEDIA_UPLOADER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_{masking_config{}};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline media_uploader_logger& get_logger() {
    static media_uploader_logger instance;
    return instance;
}

#define MU_LOG(level, category, message) \
    kcenon::media_uploader::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_CTX(level, category, message, context) \
    kcenon::media_uploader::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MU_LOG_TRACE(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::trace, category, message)

#define MU_LOG_DEBUG(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::debug, category, message)

#define MU_LOG_INFO(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::info, category, message)

#define MU_LOG_WARN(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::warn, category, message)

#define MU_LOG_ERROR(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::error, category, message)

#define MU_LOG_FATAL(category, message) \
    MU_LOG(kcenon::media_uploader::log_level::fatal, category, message)

#define MU_LOG_DEBUG_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_uploader::log_level::debug, category, message, ctx)

#define MU_LOG_INFO_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_uploader::log_level::info, category, message, ctx)

#define MU_LOG_WARN_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_uploader::log_level::warn, category, message, ctx)

#define MU_LOG_ERROR_CTX(category, message, ctx) \
    MU_LOG_CTX(kcenon::media_uploader::log_level::error, category, message, ctx)

}  // namespace kcenon::media_uploader
