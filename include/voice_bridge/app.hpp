#pragma once

#include <memory>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/chat/chat_bridge.hpp"
#include "voice_bridge/chat/chat_webhook.hpp"
#include "voice_bridge/chat/clients.hpp"
#include "voice_bridge/chat/dedup_store.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/transport/ws_server.hpp"

namespace voice_bridge {

class RelayApp {
public:
    explicit RelayApp(Config config);
    ~RelayApp();

    RelayApp(const RelayApp&) = delete;
    RelayApp& operator=(const RelayApp&) = delete;

    void init();
    void run();
    void stop();

private:
    void init_chat();
    void handle_media_connection(const std::string& connection_id,
                                 std::shared_ptr<transport::MessageChannel> channel);

    Config config_;
    chat::DedupStore dedup_store_;
    BackendClient rag_backend_;
    chat::RagQueryClient rag_client_;
    std::unique_ptr<BackendClient> chat_backend_;
    std::unique_ptr<chat::AcsChatClient> chat_client_;
    std::unique_ptr<chat::ChatBridge> chat_bridge_;
    std::unique_ptr<chat::ChatWebhook> chat_webhook_;
    std::unique_ptr<RestServer> rest_server_;
    std::unique_ptr<transport::MediaServer> media_server_;
    bool stopped_ = false;
};

}
