/**
 * @file upload_coordinator.cpp
 * @brief Batch upload with a bounded pool of concurrent workers
 */

#include "kcenon/media_uploader/upload/upload_coordinator.h"

#include "kcenon/media_uploader/core/http_utils.h"
#include "kcenon/media_uploader/core/logging.h"

#include <algorithm>

namespace kcenon::media_uploader {

namespace {

auto parse_batch_response(const http_response& response) -> batch_response {
    batch_response out;
    out.status_code = response.status_code;
    out.body = response.get_body_string();

    auto ssl_url = http_utils::extract_json_value(out.body, "assembly_ssl_url");
    if (ssl_url && !ssl_url->empty()) {
        out.batch_url = *ssl_url;
    } else if (auto url = http_utils::extract_json_value(out.body, "assembly_url")) {
        out.batch_url = *url;
    }

    if (auto tus_url = http_utils::extract_json_value(out.body, "tus_url")) {
        out.tus_url = *tus_url;
    }
    return out;
}

auto status_error(const http_response& response, const std::string& what) -> error {
    auto code = response.status_code == 413 ? error_code::rate_limited
                                            : error_code::unexpected_status;
    return error{code, what + " returned " + std::to_string(response.status_code) +
                           ": " + response.get_body_string()};
}

}  // namespace

upload_coordinator::upload_coordinator(retrying_http_client client,
                                       std::shared_ptr<url_store> store,
                                       coordinator_options options,
                                       std::shared_ptr<upload_listener> listener)
    : client_(std::move(client)),
      store_(std::move(store)),
      options_(std::move(options)),
      listener_(std::move(listener)) {
    if (!store_) {
        store_ = std::make_shared<memory_url_store>();
    }
}

upload_coordinator::~upload_coordinator() {
    abort_uploads();

    std::vector<std::unique_ptr<upload_worker>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers = std::move(retired_);
        for (auto& worker : active_) {
            workers.push_back(std::move(worker));
        }
        active_.clear();
        queue_.clear();
    }

    for (auto& worker : workers) {
        worker->cancel();
        worker->join();
    }
}

// ============================================================================
// Batch Setup
// ============================================================================

auto upload_coordinator::next_field_name() -> std::string {
    return "file_" + std::to_string(files_.size() + 1);
}

auto upload_coordinator::add_source_locked(upload_source source,
                                           std::shared_ptr<std::istream> stream,
                                           const std::string& field_name) -> result<void> {
    if (state_ != batch_state::idle) {
        return unexpected{error{error_code::invalid_state_transition,
            "cannot add " + source.name() + " to a batch in state " +
                std::string(to_string(state_))}};
    }

    auto field = field_name.empty() ? next_field_name() : field_name;
    auto taken = std::any_of(files_.begin(), files_.end(),
        [&field](const pending_file& file) { return file.field_name == field; });
    if (taken) {
        return unexpected{error{error_code::invalid_configuration,
            "field " + field + " is already used by another file in this batch"}};
    }

    total_bytes_ += source.size();
    files_.push_back({std::move(source), std::move(stream), std::move(field)});
    return {};
}

auto upload_coordinator::add_file(const std::filesystem::path& path,
                                  const std::string& field_name) -> result<void> {
    auto source = upload_source::from_file(path);
    if (!source) {
        return unexpected{source.error()};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return add_source_locked(std::move(source.value()), nullptr, field_name);
}

auto upload_coordinator::add_stream(std::shared_ptr<std::istream> stream,
                                    const std::string& name,
                                    const std::string& field_name) -> result<void> {
    auto source = upload_source::from_stream(stream, name);
    if (!source) {
        return unexpected{source.error()};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return add_source_locked(std::move(source.value()), std::move(stream), field_name);
}

void upload_coordinator::set_listener(std::shared_ptr<upload_listener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

auto upload_coordinator::current_listener() const -> std::shared_ptr<upload_listener> {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_;
}

// ============================================================================
// Batch Control
// ============================================================================

auto upload_coordinator::save(const json_value& params,
                              const std::map<std::string, std::string>& extra_fields)
    -> result<batch_response> {
    std::size_t file_total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != batch_state::idle) {
            return unexpected{error{error_code::invalid_state_transition,
                "batch already saved (state " + std::string(to_string(state_)) + ")"}};
        }
        state_ = batch_state::uploading;
        file_total = files_.size();
    }

    if (options_.mode == upload_mode::multipart) {
        return save_multipart(params, extra_fields);
    }

    auto fail = [this](error err) -> result<batch_response> {
        MU_LOG_ERROR(log_category::coordinator, "Batch creation failed: " + err.message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == batch_state::uploading) {
                state_ = batch_state::failed;
            }
            last_error_ = err;
            settled_ = true;
        }
        cv_.notify_all();
        return unexpected{std::move(err)};
    };

    auto fields = extra_fields;
    fields["tus_num_expected_upload_files"] = std::to_string(file_total);

    auto response = client_.post(options_.batch_endpoint, params, fields);
    if (!response) {
        return fail(response.error());
    }
    if (!response.value().is_success()) {
        return fail(status_error(response.value(), "batch creation"));
    }

    auto out = parse_batch_response(response.value());
    if (file_total > 0 && out.tus_url.empty()) {
        return fail(error{error_code::protocol_error,
            "batch creation response has no tus_url"});
    }

    MU_LOG_INFO(log_category::coordinator,
        "Batch created: " + out.batch_url + " (" + std::to_string(file_total) +
            " files, max " + std::to_string(options_.max_parallel_uploads) + " parallel)");

    resumable_options tus_options;
    tus_options.endpoint = out.tus_url;
    tus_options.chunk_size = options_.chunk_size;
    tus_options.resuming_enabled = options_.resuming_enabled;
    resumable_client tus(client_, store_, tus_options);

    std::vector<launch_notice> launches;
    bool all_done = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != batch_state::uploading) {
            settled_ = true;
            cv_.notify_all();
            return unexpected{error{error_code::upload_cancelled,
                "batch aborted during creation"}};
        }

        auto* observer = static_cast<upload_worker_observer*>(this);
        for (const auto& file : files_) {
            upload_job job{file.source, file.field_name, {{"assembly_url", out.batch_url}}};
            queue_.push_back(std::make_unique<upload_worker>(std::move(job), tus, observer));
        }

        launches = launch_queued_locked();
        if (queue_.empty() && active_.empty()) {
            state_ = batch_state::finished;
            all_done = true;
        }
    }

    notify_launches(launches);
    if (all_done) {
        if (auto listener = current_listener()) {
            listener->on_finished();
        }
        mark_settled();
    }

    if (options_.max_parallel_uploads > 1) {
        return out;
    }

    switch (wait()) {
        case batch_state::finished:
            return out;
        case batch_state::failed: {
            auto err = last_error();
            return unexpected{err ? *err : error{error_code::internal_error}};
        }
        default:
            return unexpected{error{error_code::upload_cancelled, "batch aborted"}};
    }
}

auto upload_coordinator::save_multipart(const json_value& params,
                                        const std::map<std::string, std::string>& extra_fields)
    -> result<batch_response> {
    request_attachments attachments;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& file : files_) {
            if (file.source.is_file()) {
                attachments.files[file.field_name] = file.source.path();
            } else {
                file.stream->clear();
                file.stream->seekg(0, std::ios::beg);
                attachments.streams[file.field_name] = file.stream;
            }
        }
    }

    auto response = client_.post(options_.batch_endpoint, params, extra_fields, attachments);

    std::optional<error> failure;
    if (!response) {
        failure = response.error();
    } else if (!response.value().is_success()) {
        failure = status_error(response.value(), "batch upload");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == batch_state::uploading) {
            state_ = failure ? batch_state::failed : batch_state::finished;
        }
        if (failure) {
            last_error_ = failure;
        } else {
            completed_ = files_.size();
        }
    }

    if (failure) {
        MU_LOG_ERROR(log_category::coordinator, "Batch upload failed: " + failure->message);
        mark_settled();
        return unexpected{*failure};
    }

    uploaded_bytes_.store(total_bytes_);
    if (auto listener = current_listener()) {
        listener->on_progress(total_bytes_, total_bytes_);
        listener->on_finished();
    }
    mark_settled();

    return parse_batch_response(response.value());
}

auto upload_coordinator::pause_uploads() -> result<void> {
    std::vector<upload_worker*> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!options_.resuming_enabled) {
            return unexpected{error{error_code::resuming_disabled,
                "cannot pause uploads: resuming is disabled"}};
        }
        if (state_ != batch_state::uploading) {
            return unexpected{error{error_code::invalid_state_transition,
                "cannot pause a batch in state " + std::string(to_string(state_))}};
        }
        paused_ = true;
        for (const auto& worker : active_) {
            targets.push_back(worker.get());
        }
    }

    auto listener = current_listener();
    result<void> outcome;
    for (auto* worker : targets) {
        auto paused = worker->pause();
        if (!paused) {
            if (is_terminal(worker->state())) {
                continue;
            }
            if (outcome) {
                outcome = paused;
            }
            continue;
        }
        if (listener) {
            listener->on_parallel_uploads_paused(worker->name());
        }
    }

    MU_LOG_INFO(log_category::coordinator,
        "Paused " + std::to_string(targets.size()) + " active uploads");
    return outcome;
}

auto upload_coordinator::resume_uploads() -> result<void> {
    std::vector<upload_worker*> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!options_.resuming_enabled) {
            return unexpected{error{error_code::resuming_disabled,
                "cannot resume uploads: resuming is disabled"}};
        }
        if (state_ != batch_state::uploading) {
            return unexpected{error{error_code::invalid_state_transition,
                "cannot resume a batch in state " + std::string(to_string(state_))}};
        }
        paused_ = false;
        for (const auto& worker : active_) {
            targets.push_back(worker.get());
        }
    }

    auto listener = current_listener();
    result<void> outcome;
    for (auto* worker : targets) {
        if (!worker->is_paused()) {
            continue;
        }
        auto resumed = worker->resume();
        if (!resumed) {
            if (outcome) {
                outcome = resumed;
            }
            continue;
        }
        if (listener) {
            listener->on_parallel_uploads_resumed(worker->name());
        }
    }

    MU_LOG_INFO(log_category::coordinator,
        "Resumed " + std::to_string(targets.size()) + " active uploads");
    return outcome;
}

void upload_coordinator::abort_uploads() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case batch_state::idle:
            case batch_state::uploading:
                break;
            default:
                return;
        }
        state_ = batch_state::aborted;
        abort_locked();
        settled_ = true;
    }
    cv_.notify_all();
    MU_LOG_INFO(log_category::coordinator, "Batch aborted");
}

void upload_coordinator::abort_locked() {
    queue_.clear();
    for (auto& worker : active_) {
        worker->cancel();
        retired_.push_back(std::move(worker));
    }
    active_.clear();
}

auto upload_coordinator::wait() -> batch_state {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == batch_state::idle) {
        return state_;
    }
    cv_.wait(lock, [this] { return settled_; });
    return state_;
}

auto upload_coordinator::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == batch_state::idle) {
        return false;
    }
    return cv_.wait_for(lock, timeout, [this] { return settled_; });
}

void upload_coordinator::mark_settled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settled_ = true;
    }
    cv_.notify_all();
}

// ============================================================================
// Worker Pool
// ============================================================================

auto upload_coordinator::launch_queued_locked() -> std::vector<launch_notice> {
    std::vector<launch_notice> launches;
    const auto limit = std::max<std::size_t>(1, options_.max_parallel_uploads);

    while (!queue_.empty() && active_.size() < limit) {
        auto worker = std::move(queue_.front());
        queue_.pop_front();

        if (paused_) {
            auto paused = worker->pause();
            if (!paused) {
                MU_LOG_WARN(log_category::coordinator,
                    worker->name() + " launched unpaused: " + paused.error().message);
            }
        }

        launches.push_back({worker.get(), launched_++});
        active_.push_back(std::move(worker));
    }
    return launches;
}

void upload_coordinator::notify_launches(const std::vector<launch_notice>& launches) {
    if (launches.empty()) {
        return;
    }

    auto listener = current_listener();
    for (const auto& launch : launches) {
        if (listener) {
            listener->on_parallel_uploads_starting(options_.max_parallel_uploads, launch.index);
        }

        auto started = launch.worker->start();
        if (!started) {
            MU_LOG_DEBUG(log_category::coordinator,
                launch.worker->name() + " not started: " + started.error().message);
        }
    }
}

void upload_coordinator::on_worker_progress(upload_worker& worker, uint64_t bytes) {
    (void)worker;
    auto uploaded = uploaded_bytes_.fetch_add(bytes) + bytes;

    std::shared_ptr<upload_listener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != batch_state::uploading) {
            return;
        }
        listener = listener_;
    }

    if (listener) {
        listener->on_progress(uploaded, total_bytes_);
    }
}

void upload_coordinator::on_worker_finished(upload_worker& worker,
                                            upload_state outcome,
                                            const error& err) {
    std::vector<launch_notice> launches;
    std::shared_ptr<upload_listener> listener;
    bool fire_finished = false;
    bool fire_failed = false;
    bool settle = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(active_.begin(), active_.end(),
            [&worker](const std::unique_ptr<upload_worker>& candidate) {
                return candidate.get() == &worker;
            });
        if (it == active_.end()) {
            // Discarded by an abort
            return;
        }
        retired_.push_back(std::move(*it));
        active_.erase(it);
        listener = listener_;

        if (state_ != batch_state::uploading) {
            return;
        }

        switch (outcome) {
            case upload_state::completed:
                ++completed_;
                launches = launch_queued_locked();
                if (active_.empty() && queue_.empty()) {
                    state_ = batch_state::finished;
                    fire_finished = true;
                    settle = true;
                }
                break;

            case upload_state::failed:
                state_ = batch_state::failed;
                last_error_ = err;
                abort_locked();
                fire_failed = true;
                settle = true;
                break;

            default:
                if (active_.empty() && queue_.empty()) {
                    state_ = batch_state::aborted;
                    settle = true;
                }
                break;
        }
    }

    notify_launches(launches);

    if (fire_failed) {
        MU_LOG_ERROR(log_category::coordinator,
            worker.name() + " failed, aborting batch: " + err.message);
        if (listener) {
            listener->on_failed(err);
        }
    }
    if (fire_finished) {
        MU_LOG_INFO(log_category::coordinator, "All uploads finished");
        if (listener) {
            listener->on_finished();
        }
    }
    if (settle) {
        mark_settled();
    }
}

// ============================================================================
// Status
// ============================================================================

auto upload_coordinator::state() const -> batch_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto upload_coordinator::progress() const -> batch_progress {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_progress snapshot;
    snapshot.uploaded_bytes = uploaded_bytes_.load();
    snapshot.total_bytes = total_bytes_;
    snapshot.total_files = files_.size();
    snapshot.completed_files = completed_;
    snapshot.active_workers = active_.size();
    snapshot.paused_workers = static_cast<std::size_t>(std::count_if(
        active_.begin(), active_.end(), [](const std::unique_ptr<upload_worker>& worker) {
            return worker->state() == upload_state::paused;
        }));
    snapshot.queued_workers = queue_.size();
    snapshot.state = state_;
    return snapshot;
}

auto upload_coordinator::active_worker_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

auto upload_coordinator::queued_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

auto upload_coordinator::file_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

auto upload_coordinator::last_error() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

}  // namespace kcenon::media_uploader
