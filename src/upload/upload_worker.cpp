/**
 * @file upload_worker.cpp
 * @brief Pausable, cancellable chunk loop for a single upload
 */

#include "kcenon/media_uploader/upload/upload_worker.h"

#include "kcenon/media_uploader/core/logging.h"

namespace kcenon::media_uploader {

namespace {

auto make_context(const upload_job& job) -> upload_log_context {
    upload_log_context ctx;
    ctx.fingerprint = job.fingerprint();
    ctx.filename = job.source.name();
    ctx.file_size = job.size();
    ctx.offset = job.uploaded_bytes;
    if (!job.upload_url.empty()) {
        ctx.url = job.upload_url;
    }
    return ctx;
}

}  // namespace

upload_worker::upload_worker(upload_job job,
                             resumable_client client,
                             upload_worker_observer* observer)
    : job_(std::move(job)),
      client_(client.with_cancellation(token_)),
      observer_(observer),
      name_("Upload - " + job_.source.name()),
      total_bytes_(job_.size()) {}

upload_worker::~upload_worker() {
    cancel();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

auto upload_worker::start() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || job_.state != upload_state::created) {
        return unexpected{error{error_code::invalid_state_transition,
            name_ + " cannot start from state " + to_string(job_.state)}};
    }
    started_ = true;
    job_.state = upload_state::running;
    thread_ = std::thread([this] { run(); });
    return {};
}

auto upload_worker::pause() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_.resuming_enabled()) {
        return unexpected{error{error_code::resuming_disabled,
            "cannot pause " + name_ + ": resuming is disabled"}};
    }
    if (is_terminal(job_.state) || cancel_requested_) {
        return unexpected{error{error_code::invalid_state_transition,
            "cannot pause " + name_ + " in state " + to_string(job_.state)}};
    }

    pause_requested_ = true;
    MU_LOG_DEBUG(log_category::worker, name_ + ": pause requested");
    return {};
}

auto upload_worker::resume() -> result<void> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!client_.resuming_enabled()) {
        return unexpected{error{error_code::resuming_disabled,
            "cannot resume " + name_ + ": resuming is disabled"}};
    }
    if (is_terminal(job_.state) || cancel_requested_) {
        return unexpected{error{error_code::invalid_state_transition,
            "cannot resume " + name_ + " in state " + to_string(job_.state)}};
    }

    if (job_.state != upload_state::paused) {
        if (!pause_requested_) {
            return unexpected{error{error_code::invalid_state_transition,
                "cannot resume " + name_ + ": not paused"}};
        }
        // Not parked yet, the open handle is still valid
        pause_requested_ = false;
        return {};
    }

    if (reopening_ || reopened_) {
        return {};
    }
    reopening_ = true;
    lock.unlock();

    auto reopened = client_.resume_upload(job_);

    lock.lock();
    reopening_ = false;

    if (!reopened) {
        auto ctx = make_context(job_);
        ctx.error_message = reopened.error().message;
        MU_LOG_WARN_CTX(log_category::worker, name_ + ": resume failed", ctx);
        return unexpected{reopened.error()};
    }

    if (cancel_requested_ || job_.state != upload_state::paused) {
        return {};
    }

    reopened_.emplace(std::move(reopened.value()));
    pause_requested_ = false;
    lock.unlock();
    cv_.notify_all();
    return {};
}

void upload_worker::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(job_.state) || cancel_requested_) {
            return;
        }
        cancel_requested_ = true;
        if (!started_) {
            job_.state = upload_state::cancelled;
        }
    }
    token_.request_stop();
    cv_.notify_all();
}

void upload_worker::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

auto upload_worker::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return is_terminal(job_.state); });
}

auto upload_worker::state() const -> upload_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return job_.state;
}

auto upload_worker::is_paused() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return !is_terminal(job_.state) &&
           (job_.state == upload_state::paused || pause_requested_);
}

auto upload_worker::upload_url() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return job_.upload_url;
}

auto upload_worker::last_error() const -> error {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void upload_worker::report_progress(uint64_t bytes) {
    uploaded_bytes_.fetch_add(bytes);
    if (observer_ != nullptr && bytes > 0) {
        observer_->on_worker_progress(*this, bytes);
    }
}

void upload_worker::run() {
    auto start_ctx = make_context(job_);
    MU_LOG_DEBUG_CTX(log_category::worker, name_ + ": started", start_ctx);

    auto opened = client_.resume_or_create_upload(job_);
    if (!opened) {
        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled = cancel_requested_;
        }
        if (cancelled) {
            finalize(upload_state::cancelled, {});
        } else {
            finalize(upload_state::failed, opened.error());
        }
        return;
    }

    std::optional<resumable_uploader> uploader;
    uploader.emplace(std::move(opened.value()));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job_.upload_url = uploader->url();
        job_.uploaded_bytes = uploader->offset();
    }
    report_progress(uploader->offset());

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cancel_requested_) {
                lock.unlock();
                uploader->finish();
                finalize(upload_state::cancelled, {});
                return;
            }

            if (pause_requested_) {
                uploader->finish();
                job_.state = upload_state::paused;
                auto paused_ctx = make_context(job_);
                MU_LOG_INFO_CTX(log_category::worker, name_ + ": paused", paused_ctx);
                cv_.notify_all();

                cv_.wait(lock, [this] { return cancel_requested_ || reopened_.has_value(); });
                if (cancel_requested_) {
                    lock.unlock();
                    finalize(upload_state::cancelled, {});
                    return;
                }

                uploader.emplace(std::move(*reopened_));
                reopened_.reset();
                job_.state = upload_state::running;
                job_.uploaded_bytes = uploader->offset();
                auto resumed_ctx = make_context(job_);
                MU_LOG_INFO_CTX(log_category::worker, name_ + ": resumed", resumed_ctx);
                lock.unlock();

                // Bytes the server stored beyond our last acknowledged chunk
                auto known = uploaded_bytes_.load();
                if (uploader->offset() > known) {
                    report_progress(uploader->offset() - known);
                }
                continue;
            }
        }

        auto sent = uploader->upload_chunk();
        if (!sent) {
            uploader->finish();
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled = cancel_requested_;
            }
            if (cancelled) {
                finalize(upload_state::cancelled, {});
            } else {
                finalize(upload_state::failed, sent.error());
            }
            return;
        }

        if (sent.value() < 0) {
            uploader->finish();
            finalize(upload_state::completed, {});
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            job_.uploaded_bytes = uploader->offset();
        }
        report_progress(static_cast<uint64_t>(sent.value()));
    }
}

void upload_worker::finalize(upload_state outcome, error err) {
    upload_log_context ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = err;
        ctx = make_context(job_);
    }

    switch (outcome) {
        case upload_state::completed:
            MU_LOG_INFO_CTX(log_category::worker, name_ + ": completed", ctx);
            break;
        case upload_state::failed:
            ctx.error_message = err.message;
            MU_LOG_ERROR_CTX(log_category::worker, name_ + ": failed", ctx);
            break;
        default:
            MU_LOG_INFO_CTX(log_category::worker, name_ + ": cancelled", ctx);
            break;
    }

    // The terminal state becomes visible only after the observer has been told
    if (observer_ != nullptr) {
        observer_->on_worker_finished(*this, outcome, err);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        job_.state = outcome;
    }
    cv_.notify_all();
}

}  // namespace kcenon::media_uploader
