#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace voice_bridge {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using ChatEventsHandler = std::function<RestResponse(const std::string&)>;

    RestServer(std::string host, int port, ChatEventsHandler on_chat_events);

    void start();
    void stop();

private:
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    std::string host_;
    int port_;
    ChatEventsHandler on_chat_events_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
