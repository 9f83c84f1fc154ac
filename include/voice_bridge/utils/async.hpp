#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace voice_bridge {
namespace utils {

class CancellationSignal {
public:
    using Callback = std::function<void()>;

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    bool cancel();
    bool is_cancelled() const;
    void on_cancel(Callback callback);

    // Returns true if cancelled.
    bool wait_for(std::chrono::steady_clock::duration timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::vector<Callback> callbacks_;
};

}
}
