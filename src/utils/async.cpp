#include "voice_bridge/utils/async.hpp"

#include <exception>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

bool CancellationSignal::cancel() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return false;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& ex) {
            logging::error("Cancellation callback failed", {kv("error", ex.what())});
        }
    }
    return true;
}

bool CancellationSignal::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationSignal::on_cancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

bool CancellationSignal::wait_for(std::chrono::steady_clock::duration timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

}
