#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace voice_bridge::chat {

inline constexpr const char* kSubscriptionValidationEvent =
    "Microsoft.EventGrid.SubscriptionValidationEvent";
inline constexpr const char* kChatMessageReceivedEvent =
    "Microsoft.Communication.ChatMessageReceived";

struct ValidationRequest {
    std::string validation_code;
};

struct ChatMessage {
    std::string thread_id;
    std::string message_id;
    std::string sender_id;
    std::string text;
};

struct IgnoredEvent {
    std::string event_type;
};

using ChatEvent = std::variant<ValidationRequest, ChatMessage, IgnoredEvent>;

std::optional<std::vector<ChatEvent>> decode_events(const std::string& body);

}
