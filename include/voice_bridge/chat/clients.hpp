#pragma once

#include <optional>
#include <string>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/chat/chat_bridge.hpp"

namespace voice_bridge::chat {

class RagQueryClient : public QueryBackend {
public:
    explicit RagQueryClient(BackendClient& client);

    std::optional<std::string> ask(const std::string& question) override;

private:
    BackendClient& client_;
};

class AcsChatClient : public ChatThreadSender {
public:
    AcsChatClient(BackendClient& client, std::string api_version);

    void send_message(const std::string& thread_id, const std::string& text) override;

private:
    BackendClient& client_;
    std::string api_version_;
};

}
