/**
 * @file retrying_http_client.cpp
 * @brief Signed HTTP verbs with transient-failure and rate-limit retries
 */

#include "kcenon/media_uploader/request/retrying_http_client.h"

#include "kcenon/media_uploader/core/http_utils.h"
#include "kcenon/media_uploader/core/logging.h"
#include "kcenon/media_uploader/core/version.h"
#include "kcenon/media_uploader/request/multipart_form.h"

#include <thread>

namespace kcenon::media_uploader {

namespace {

constexpr const char* CLIENT_HEADER = "Transloadit-Client";

}  // namespace

retrying_http_client::retrying_http_client(
    std::shared_ptr<http_transport_interface> transport,
    request_signer signer,
    std::string host,
    retry_policy policy)
    : transport_(std::move(transport)),
      signer_(std::move(signer)),
      host_(std::move(host)),
      policy_(std::move(policy)) {}

auto retrying_http_client::with_sleep_function(sleep_function sleep) const
    -> retrying_http_client {
    auto copy = *this;
    copy.sleep_ = std::move(sleep);
    return copy;
}

auto retrying_http_client::with_cancellation(cancellation_token token) const
    -> retrying_http_client {
    auto copy = *this;
    copy.token_ = std::move(token);
    return copy;
}

auto retrying_http_client::client_identifier() -> std::string {
    return "media-uploader-cpp:" + version::to_string();
}

auto retrying_http_client::resolve(const std::string& url) const -> std::string {
    if (http_utils::is_absolute_url(url)) {
        return url;
    }
    return http_utils::resolve_url(host_, url);
}

// ============================================================================
// Signed Verbs
// ============================================================================

auto retrying_http_client::get(const std::string& url, const json_value& params)
    -> result<http_response> {
    auto payload = signer_.sign(params);
    if (!payload) {
        return unexpected{payload.error()};
    }

    http_request request;
    request.method = http_method::get;
    request.url = http_utils::append_query(resolve(url), payload.value().to_fields());
    return send_with_retry([&request]() -> result<http_request> { return request; }, false);
}

auto retrying_http_client::post(const std::string& url,
                                const json_value& params,
                                const std::map<std::string, std::string>& extra_fields,
                                const request_attachments& attachments)
    -> result<http_response> {
    return send_multipart(http_method::post, url, params, extra_fields, attachments);
}

auto retrying_http_client::put(const std::string& url, const json_value& params)
    -> result<http_response> {
    return send_multipart(http_method::put, url, params, {}, {});
}

auto retrying_http_client::del(const std::string& url, const json_value& params)
    -> result<http_response> {
    return send_multipart(http_method::del, url, params, {}, {});
}

auto retrying_http_client::execute(http_request request) -> result<http_response> {
    request.url = resolve(request.url);
    return send_with_retry([&request]() -> result<http_request> { return request; }, false);
}

// ============================================================================
// Internals
// ============================================================================

auto retrying_http_client::send_multipart(
    http_method method,
    const std::string& url,
    const json_value& params,
    const std::map<std::string, std::string>& extra_fields,
    const request_attachments& attachments) -> result<http_response> {
    for (const auto& [name, stream] : attachments.streams) {
        if (!stream) {
            return unexpected{error{error_code::file_read_error,
                "null stream attached as " + name}};
        }
    }

    // Resubmissions read every stream again from where the first one started
    std::map<std::string, std::streampos> stream_starts;
    for (const auto& [name, stream] : attachments.streams) {
        stream_starts[name] = stream->tellg();
    }

    auto target = resolve(url);
    auto build = [&]() -> result<http_request> {
        auto payload = signer_.sign(params);
        if (!payload) {
            return unexpected{payload.error()};
        }

        multipart_form form;
        for (const auto& [name, value] : payload.value().to_fields()) {
            form.add_field(name, value);
        }
        for (const auto& [name, value] : extra_fields) {
            form.add_field(name, value);
        }
        for (const auto& [name, path] : attachments.files) {
            auto added = form.add_file(name, path);
            if (!added) {
                return unexpected{added.error()};
            }
        }
        for (const auto& [name, stream] : attachments.streams) {
            auto start = stream_starts[name];
            if (start != std::streampos(-1)) {
                stream->clear();
                stream->seekg(start);
            }
            auto added = form.add_stream(name, *stream);
            if (!added) {
                return unexpected{added.error()};
            }
        }

        http_request request;
        request.method = method;
        request.url = target;
        request.headers["Content-Type"] = form.content_type();
        request.body = form.body();
        return request;
    };

    return send_with_retry(build, method == http_method::post);
}

auto retrying_http_client::backoff(std::chrono::milliseconds delay) const -> bool {
    if (token_ && token_->stop_requested()) {
        return false;
    }

    bool completed = true;
    if (sleep_) {
        completed = sleep_(delay);
    } else if (token_) {
        completed = token_->sleep_for(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }

    return completed && !(token_ && token_->stop_requested());
}

auto retrying_http_client::send_with_retry(const request_builder& build, bool retry_rate_limit)
    -> result<http_response> {
    if (!transport_) {
        return unexpected{error{error_code::not_initialized, "HTTP transport not set"}};
    }

    auto prepare = [&build]() -> result<http_request> {
        auto built = build();
        if (built) {
            built.value().headers[CLIENT_HEADER] = client_identifier();
        }
        return built;
    };

    auto prepared = prepare();
    if (!prepared) {
        return unexpected{prepared.error()};
    }
    auto request = std::move(prepared.value());
    retry_state state(policy_);

    while (true) {
        if (token_ && token_->stop_requested()) {
            return unexpected{error{error_code::interrupted,
                std::string(to_string(request.method)) + " " + request.url + " interrupted"}};
        }

        auto response = transport_->send(request);

        if (!response) {
            const auto& cause = response.error();
            if (cause.is_local_operation()) {
                return unexpected{cause};
            }

            if (policy_.qualifies(cause.message) && state.consume_request_exception_attempt()) {
                auto delay = policy_.next_backoff();

                upload_log_context ctx;
                ctx.url = request.url;
                ctx.attempts_left = state.request_exception_attempts_left();
                ctx.delay_ms = static_cast<uint64_t>(delay.count());
                ctx.error_message = cause.message;
                MU_LOG_WARN_CTX(log_category::request, "Transient failure, retrying", ctx);

                if (!backoff(delay)) {
                    return unexpected{error{error_code::interrupted,
                        "retry backoff interrupted: " + cause.message}};
                }
                continue;
            }

            MU_LOG_ERROR(log_category::request,
                         std::string(to_string(request.method)) + " " + request.url +
                             " failed: " + cause.message);
            return unexpected{error{error_code::request_failed, cause.message}};
        }

        if (retry_rate_limit && response.value().status_code == 413 &&
            state.consume_rate_limit_attempt()) {
            auto delay = policy_.rate_limit_delay(response.value().get_body_string());

            upload_log_context ctx;
            ctx.url = request.url;
            ctx.status_code = 413;
            ctx.attempts_left = state.rate_limit_attempts_left();
            ctx.delay_ms = static_cast<uint64_t>(delay.count());
            MU_LOG_WARN_CTX(log_category::request, "Rate limited, resubmitting", ctx);

            if (!backoff(delay)) {
                return unexpected{error{error_code::interrupted,
                    "rate limit backoff interrupted"}};
            }

            // Each resubmission carries a fresh signature
            auto resigned = prepare();
            if (!resigned) {
                return unexpected{resigned.error()};
            }
            request = std::move(resigned.value());
            continue;
        }

        MU_LOG_DEBUG(log_category::request,
                     std::string(to_string(request.method)) + " " + request.url + " -> " +
                         std::to_string(response.value().status_code));
        return response;
    }
}

}  // namespace kcenon::media_uploader
