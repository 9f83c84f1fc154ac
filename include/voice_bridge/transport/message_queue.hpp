#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace voice_bridge::transport {

class MessageQueue {
public:
    bool push(std::string message);

    std::optional<std::string> pop();

    // End of stream: queued messages are still delivered.
    void finish();

    // Local shutdown: queued messages are dropped, readers wake immediately.
    void abort();


private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> messages_;
    bool finished_ = false;
};

}
