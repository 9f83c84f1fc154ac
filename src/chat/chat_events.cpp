#include "voice_bridge/chat/chat_events.hpp"

#include <nlohmann/json.hpp>

namespace voice_bridge::chat {

namespace {

std::string string_field(const nlohmann::json& node, const char* key) {
    if (!node.is_object()) {
        return {};
    }
    const auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

ChatEvent decode_event(const nlohmann::json& item) {
    if (!item.is_object()) {
        return IgnoredEvent{};
    }
    const auto event_type = string_field(item, "eventType");
    const auto data_it = item.find("data");
    const nlohmann::json data = data_it != item.end() ? *data_it : nlohmann::json::object();

    if (event_type == kSubscriptionValidationEvent) {
        return ValidationRequest{string_field(data, "validationCode")};
    }
    if (event_type == kChatMessageReceivedEvent) {
        ChatMessage message;
        message.thread_id = string_field(data, "threadId");
        message.message_id = string_field(data, "messageId");
        message.text = string_field(data, "messageBody");
        if (data.is_object()) {
            const auto sender = data.find("senderCommunicationIdentifier");
            if (sender != data.end()) {
                message.sender_id = string_field(*sender, "rawId");
            }
        }
        return message;
    }
    return IgnoredEvent{event_type};
}

}

std::optional<std::vector<ChatEvent>> decode_events(const std::string& body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return std::nullopt;
    }
    std::vector<ChatEvent> events;
    events.reserve(parsed.size());
    for (const auto& item : parsed) {
        events.push_back(decode_event(item));
    }
    return events;
}

}
