#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/chat/chat_bridge.hpp"

namespace voice_bridge::chat {

struct WebhookReply {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

class ChatWebhook {
public:
    explicit ChatWebhook(ChatBridge* bridge);

    WebhookReply handle(const std::string& body);

private:
    ChatBridge* bridge_;
};

}
