#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "voice_bridge/transport/message_channel.hpp"

namespace voice_bridge::transport {

class MediaServer {
public:
    using AcceptHandler = std::function<void(const std::string& connection_id,
                                             std::shared_ptr<MessageChannel> channel)>;

    MediaServer(std::string host, int port, std::string path, AcceptHandler on_accept);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    void start();
    void stop();

    std::size_t active_connections() const;

    struct WsState;
    class Connection;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_open(const std::string& connection_id, std::shared_ptr<Connection> connection);
    void reap_finished_workers();

    std::string host_;
    int port_;
    std::string path_;
    AcceptHandler on_accept_;
    std::unique_ptr<WsState> ws_state_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

}
