#include "voice_bridge/chat/chat_webhook.hpp"

#include "voice_bridge/chat/chat_events.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge::chat {

ChatWebhook::ChatWebhook(ChatBridge* bridge) : bridge_(bridge) {}

WebhookReply ChatWebhook::handle(const std::string& body) {
    const auto events = decode_events(body);
    if (!events) {
        logging::warn("Chat webhook body is not an event array");
        return {400, {{"message", "invalid request body"}}};
    }
    for (const auto& event : *events) {
        if (const auto* validation = std::get_if<ValidationRequest>(&event)) {
            logging::info("Chat event subscription validated");
            return {200, {{"validationResponse", validation->validation_code}}};
        }
        const auto* message = std::get_if<ChatMessage>(&event);
        if (!message) {
            logging::debug("Chat event ignored",
                           {kv("event_type", std::get<IgnoredEvent>(event).event_type)});
            continue;
        }
        if (!bridge_) {
            logging::warn("Chat message received while chat is disabled",
                          {kv("thread_id", message->thread_id)});
            return {503, {{"message", "chat is not configured"}}};
        }
        logging::info("Chat message event",
                      {kv("thread_id", message->thread_id),
                       kv("message_id", message->message_id),
                       kv("sender_id", message->sender_id)});
        if (message->text.empty() || message->thread_id.empty()) {
            logging::info("Skipping empty message or invalid thread");
            continue;
        }
        bridge_->handle(message->thread_id, message->message_id, message->sender_id,
                        message->text);
    }
    return {};
}

}
