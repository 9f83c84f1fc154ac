#pragma once

#include <optional>
#include <string>

#include "voice_bridge/chat/dedup_store.hpp"

namespace voice_bridge::chat {

inline constexpr const char* kEmptyAnswerReply =
    "I received an empty response from the knowledge base.";
inline constexpr const char* kBackendFailureReply =
    "Sorry, I'm having trouble connecting to my knowledge base right now.";

class QueryBackend {
public:
    virtual ~QueryBackend() = default;
    virtual std::optional<std::string> ask(const std::string& question) = 0;
};

class ChatThreadSender {
public:
    virtual ~ChatThreadSender() = default;
    virtual void send_message(const std::string& thread_id, const std::string& text) = 0;
};

class ChatBridge {
public:
    ChatBridge(DedupStore& store,
               QueryBackend& backend,
               ChatThreadSender& sender,
               std::string bot_id);

    // Never throws. Returns true when a reply was posted to the thread.
    bool handle(const std::string& thread_id,
                const std::string& message_id,
                const std::string& sender_id,
                const std::string& text);

private:
    std::string answer_for(const std::string& thread_id, const std::string& text);

    DedupStore& store_;
    QueryBackend& backend_;
    ChatThreadSender& sender_;
    std::string bot_id_;
};

}
