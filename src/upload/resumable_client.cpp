/**
 * @file resumable_client.cpp
 * @brief Client side of the tus 1.0.0 resumable upload protocol
 */

#include "kcenon/media_uploader/upload/resumable_client.h"

#include "kcenon/media_uploader/core/http_utils.h"
#include "kcenon/media_uploader/core/logging.h"

#include <charconv>

namespace kcenon::media_uploader {

namespace {

auto parse_offset(const std::optional<std::string>& header) -> std::optional<uint64_t> {
    if (!header || header->empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const auto* begin = header->data();
    const auto* end = header->data() + header->size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto make_context(const upload_job& job) -> upload_log_context {
    upload_log_context ctx;
    ctx.fingerprint = job.fingerprint();
    ctx.filename = job.source.name();
    ctx.file_size = job.size();
    return ctx;
}

}  // namespace

// ============================================================================
// resumable_uploader
// ============================================================================

resumable_uploader::resumable_uploader(retrying_http_client client,
                                       upload_source source,
                                       std::string url,
                                       uint64_t offset,
                                       std::size_t chunk_size)
    : client_(std::move(client)),
      source_(std::move(source)),
      url_(std::move(url)),
      offset_(offset),
      chunk_size_(chunk_size) {}

auto resumable_uploader::upload_chunk() -> result<int64_t> {
    if (finished_) {
        return unexpected{error{error_code::invalid_state_transition,
            "upload handle already finished: " + url_}};
    }

    if (offset_ >= source_.size()) {
        return int64_t{-1};
    }

    auto data = source_.read_at(offset_, chunk_size_);
    if (!data) {
        return unexpected{data.error()};
    }
    auto sent = static_cast<uint64_t>(data.value().size());

    http_request request;
    request.method = http_method::patch;
    request.url = url_;
    request.headers["Tus-Resumable"] = TUS_VERSION;
    request.headers["Upload-Offset"] = std::to_string(offset_);
    request.headers["Content-Type"] = "application/offset+octet-stream";
    request.body = std::move(data.value());

    auto response = client_.execute(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected{error{error_code::unexpected_status,
            "PATCH " + url_ + " returned " + std::to_string(resp.status_code)}};
    }

    auto new_offset = parse_offset(resp.get_header("Upload-Offset"));
    if (!new_offset) {
        return unexpected{error{error_code::protocol_error,
            "PATCH " + url_ + " response has no valid Upload-Offset"}};
    }
    if (*new_offset != offset_ + sent) {
        return unexpected{error{error_code::protocol_error,
            "PATCH " + url_ + " acknowledged offset " + std::to_string(*new_offset) +
                ", expected " + std::to_string(offset_ + sent)}};
    }

    offset_ = *new_offset;
    return static_cast<int64_t>(sent);
}

void resumable_uploader::finish() {
    finished_ = true;
}

// ============================================================================
// resumable_client
// ============================================================================

resumable_client::resumable_client(retrying_http_client client,
                                   std::shared_ptr<url_store> store,
                                   resumable_options options)
    : client_(std::move(client)),
      store_(std::move(store)),
      options_(std::move(options)) {
    if (!store_) {
        store_ = std::make_shared<memory_url_store>();
    }
}

auto resumable_client::with_cancellation(cancellation_token token) const
    -> resumable_client {
    auto copy = *this;
    copy.client_ = client_.with_cancellation(std::move(token));
    return copy;
}

auto resumable_client::encode_metadata(const upload_job& job) -> std::string {
    auto metadata = job.metadata;
    metadata.emplace("filename", job.source.name());
    if (!job.field_name.empty()) {
        metadata.emplace("fieldname", job.field_name);
    }

    std::string out;
    for (const auto& [key, value] : metadata) {
        if (!out.empty()) out += ',';
        out += key;
        out += ' ';
        out += http_utils::base64_encode(value);
    }
    return out;
}

auto resumable_client::create_upload(const upload_job& job) -> result<resumable_uploader> {
    if (options_.endpoint.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "resumable endpoint not set"}};
    }

    http_request request;
    request.method = http_method::post;
    request.url = options_.endpoint;
    request.headers["Tus-Resumable"] = TUS_VERSION;
    request.headers["Upload-Length"] = std::to_string(job.size());
    request.headers["Upload-Metadata"] = encode_metadata(job);

    auto response = client_.execute(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (resp.status_code != 201) {
        return unexpected{error{error_code::unexpected_status,
            "upload creation returned " + std::to_string(resp.status_code) +
                ", expected 201"}};
    }

    auto location = resp.get_header("Location");
    if (!location || location->empty()) {
        return unexpected{error{error_code::protocol_error,
            "upload creation response has no Location header"}};
    }

    auto url = http_utils::resolve_url(client_.resolve(options_.endpoint), *location);

    auto ctx = make_context(job);
    ctx.url = url;
    MU_LOG_DEBUG_CTX(log_category::resumable, "Upload created", ctx);

    if (options_.resuming_enabled) {
        auto stored = store_->set(job.fingerprint(), url);
        if (!stored) {
            ctx.error_message = stored.error().message;
            MU_LOG_WARN_CTX(log_category::resumable,
                "Upload URL not recorded; this upload cannot be resumed later", ctx);
        }
    }

    return resumable_uploader(client_, job.source, url, 0, options_.chunk_size);
}

auto resumable_client::resume_upload(const upload_job& job) -> result<resumable_uploader> {
    if (!options_.resuming_enabled) {
        return unexpected{error{error_code::resuming_disabled,
            "resuming is disabled for this client"}};
    }

    auto url = store_->get(job.fingerprint());
    if (!url) {
        return unexpected{error{error_code::fingerprint_not_found,
            "no upload recorded for fingerprint " + job.fingerprint()}};
    }

    http_request request;
    request.method = http_method::head;
    request.url = *url;
    request.headers["Tus-Resumable"] = TUS_VERSION;

    auto response = client_.execute(std::move(request));
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (resp.status_code == 403 || resp.status_code == 404 || resp.status_code == 410) {
        return unexpected{error{error_code::upload_handle_unavailable,
            "upload " + *url + " is no longer available (" +
                std::to_string(resp.status_code) + ")"}};
    }
    if (!resp.is_success()) {
        return unexpected{error{error_code::unexpected_status,
            "HEAD " + *url + " returned " + std::to_string(resp.status_code)}};
    }

    auto offset = parse_offset(resp.get_header("Upload-Offset"));
    if (!offset || *offset > job.size()) {
        return unexpected{error{error_code::protocol_error,
            "HEAD " + *url + " response has no valid Upload-Offset"}};
    }

    auto ctx = make_context(job);
    ctx.url = *url;
    ctx.offset = *offset;
    MU_LOG_DEBUG_CTX(log_category::resumable, "Upload resumed", ctx);

    return resumable_uploader(client_, job.source, *url, *offset, options_.chunk_size);
}

auto resumable_client::resume_or_create_upload(const upload_job& job)
    -> result<resumable_uploader> {
    if (!options_.resuming_enabled) {
        return create_upload(job);
    }

    auto resumed = resume_upload(job);
    if (resumed) {
        return resumed;
    }

    switch (resumed.error().code) {
        case error_code::upload_handle_unavailable:
            store_->remove(job.fingerprint());
            [[fallthrough]];
        case error_code::fingerprint_not_found:
            return create_upload(job);
        default:
            return resumed;
    }
}

}  // namespace kcenon::media_uploader
