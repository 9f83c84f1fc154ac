#include "voice_bridge/chat/dedup_store.hpp"

#include <utility>

namespace voice_bridge::chat {

DedupStore::DedupStore(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

bool DedupStore::try_claim(const std::string& message_id) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    evict_locked(now);
    return expiry_.emplace(message_id, now + ttl_).second;
}

std::size_t DedupStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expiry_.size();
}

std::size_t DedupStore::evict_locked(std::chrono::steady_clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = expiry_.begin(); it != expiry_.end();) {
        if (it->second <= now) {
            it = expiry_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
