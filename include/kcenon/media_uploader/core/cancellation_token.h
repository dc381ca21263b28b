/**
 * @file cancellation_token.h
 * @brief Shared stop signal that wakes interruptible waits
 */

#ifndef KCENON_MEDIA_UPLOADER_CORE_CANCELLATION_TOKEN_H
#define KCENON_MEDIA_UPLOADER_CORE_CANCELLATION_TOKEN_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kcenon::media_uploader {

/**
 * @brief Stop signal shared between a controller and a blocking operation
 *
 * Copies share state. Once stopped a token stays stopped.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    /**
     * @brief Request stop and wake every waiter
     */
    void request_stop() const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->stopped = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto stop_requested() const -> bool {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->stopped;
    }

    /**
     * @brief Sleep for @p duration unless stop is requested first
     * @return true if the full duration elapsed, false if interrupted
     */
    [[nodiscard]] auto sleep_for(std::chrono::milliseconds duration) const -> bool {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this] { return state_->stopped; });
    }

private:
    struct state {
        std::mutex mutex;
        std::condition_variable cv;
        bool stopped = false;
    };

    std::shared_ptr<state> state_;
};

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CORE_CANCELLATION_TOKEN_H
