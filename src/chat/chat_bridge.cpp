#include "voice_bridge/chat/chat_bridge.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::chat {

ChatBridge::ChatBridge(DedupStore& store,
                       QueryBackend& backend,
                       ChatThreadSender& sender,
                       std::string bot_id)
    : store_(store),
      backend_(backend),
      sender_(sender),
      bot_id_(std::move(bot_id)) {}

bool ChatBridge::handle(const std::string& thread_id,
                        const std::string& message_id,
                        const std::string& sender_id,
                        const std::string& text) {
    if (text.empty()) {
        return false;
    }
    if (!bot_id_.empty() && sender_id == bot_id_) {
        logging::debug("Ignoring own chat message",
                       {kv("thread_id", thread_id), kv("message_id", message_id)});
        return false;
    }
    try {
        if (!store_.try_claim(message_id)) {
            Metrics::instance().increment_chat_duplicate();
            logging::warn("Duplicate chat message dropped",
                          {kv("thread_id", thread_id), kv("message_id", message_id)});
            return false;
        }
        logging::info("Chat message received",
                      {kv("thread_id", thread_id),
                       kv("message_id", message_id),
                       kv("tracked_ids", store_.size()),
                       kv("text", utils::truncate_for_log(text))});
        const auto reply = answer_for(thread_id, text);
        sender_.send_message(thread_id, reply);
        Metrics::instance().increment_chat_processed();
        return true;
    } catch (const std::exception& ex) {
        logging::error("Chat message handling failed",
                       {kv("thread_id", thread_id),
                        kv("message_id", message_id),
                        kv("error", ex.what())});
    }
    return false;
}

std::string ChatBridge::answer_for(const std::string& thread_id, const std::string& text) {
    const auto started = std::chrono::steady_clock::now();
    try {
        auto answer = backend_.ask(text);
        Metrics::instance().observe_backend_query(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
        if (!answer || answer->empty()) {
            logging::warn("Backend returned no answer", {kv("thread_id", thread_id)});
            return kEmptyAnswerReply;
        }
        return *answer;
    } catch (const BackendError& ex) {
        logging::error("Backend query failed",
                       {kv("thread_id", thread_id), kv("error", ex.what())});
    }
    return kBackendFailureReply;
}

}
