#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/transport/message_channel.hpp"
#include "voice_bridge/transport/message_queue.hpp"

namespace voice_bridge::testing {

// In-memory MessageChannel: the test plays the remote peer.
class FakeChannel : public transport::MessageChannel {
public:
    struct Sent {
        std::string text;
        std::chrono::steady_clock::time_point at;
    };

    bool send_text(const std::string& text) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            hook = on_send_;
        }
        if (hook) {
            hook(text);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            sent_.push_back({text, std::chrono::steady_clock::now()});
        }
        cv_.notify_all();
        return true;
    }

    std::optional<std::string> receive() override { return inbound_.pop(); }

    void close(const std::string& reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            close_reason_ = reason;
        }
        inbound_.abort();
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    void push_inbound(std::string message) { inbound_.push(std::move(message)); }
    // Peer hangs up after the queued messages are read.
    void finish_inbound() { inbound_.finish(); }

    // Runs before the message is recorded; may block to hold the writer.
    void on_send(std::function<void(const std::string&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_send_ = std::move(hook);
    }

    bool wait_for_sent(std::size_t count,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return sent_.size() >= count; });
    }

    bool wait_for_closed(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return closed_; });
    }

    std::vector<Sent> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::string close_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_reason_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    transport::MessageQueue inbound_;
    std::vector<Sent> sent_;
    std::function<void(const std::string&)> on_send_;
    bool closed_ = false;
    std::string close_reason_;
};

}
