#include "voice_bridge/transport/message_queue.hpp"

namespace voice_bridge::transport {

bool MessageQueue::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> MessageQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return finished_ || !messages_.empty(); });
    if (messages_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

void MessageQueue::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void MessageQueue::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        messages_.clear();
    }
    cv_.notify_all();
}

}
