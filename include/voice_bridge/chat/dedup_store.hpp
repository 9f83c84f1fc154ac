#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace voice_bridge::chat {

class DedupStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit DedupStore(std::chrono::seconds ttl = std::chrono::minutes(5),
                        Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Returns false for a duplicate.
    bool try_claim(const std::string& message_id);

    std::size_t size() const;

private:
    std::size_t evict_locked(std::chrono::steady_clock::time_point now);

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> expiry_;
};

}
