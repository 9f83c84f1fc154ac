#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "voice_bridge/transport/message_channel.hpp"

namespace voice_bridge::transport {

class WsClientChannel : public MessageChannel {
public:
    WsClientChannel(std::string url, std::chrono::seconds connect_timeout);
    ~WsClientChannel() override;

    WsClientChannel(const WsClientChannel&) = delete;
    WsClientChannel& operator=(const WsClientChannel&) = delete;

    void connect();

    bool send_text(const std::string& text) override;
    std::optional<std::string> receive() override;
    void close(const std::string& reason) override;
    bool is_open() const override;


    class Endpoint;

private:
    std::string url_;
    std::chrono::seconds connect_timeout_;
    std::unique_ptr<Endpoint> endpoint_;
};

std::shared_ptr<MessageChannel> connect_websocket(const std::string& url,
                                                  std::chrono::seconds connect_timeout);

}
