#include "voice_bridge/transport/ws_server.hpp"

#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/transport/message_queue.hpp"

namespace voice_bridge::transport {

namespace {

using Server = websocketpp::server<websocketpp::config::asio>;

constexpr const char* kCallConnectionHeader = "x-ms-call-connection-id";

std::string make_connection_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << generator();
    return out.str();
}

std::string strip_query(const std::string& resource) {
    const auto pos = resource.find('?');
    return pos == std::string::npos ? resource : resource.substr(0, pos);
}

}

class MediaServer::Connection : public MessageChannel {
public:
    Connection(Server& server, websocketpp::connection_hdl hdl)
        : server_(server),
          hdl_(std::move(hdl)) {}

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!open_) {
            return false;
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::debug("Media send failed", {kv("error", ec.message())});
            return false;
        }
        return true;
    }

    std::optional<std::string> receive() override {
        return queue_.pop();
    }

    void close(const std::string& reason) override {
        queue_.abort();
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!open_) {
            return;
        }
        open_ = false;
        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::normal, reason, ec);
        if (ec) {
            logging::debug("Media close failed", {kv("error", ec.message())});
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        return open_;
    }

    void deliver(std::string message) {
        queue_.push(std::move(message));
    }

    void peer_closed() {
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            open_ = false;
        }
        queue_.finish();
    }

private:
    Server& server_;
    websocketpp::connection_hdl hdl_;
    mutable std::mutex ws_mutex_;
    bool open_ = true;
    MessageQueue queue_;
};

struct MediaServer::WsState {
    Server server;
    std::mutex mutex;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<MediaServer::Connection>,
             std::owner_less<websocketpp::connection_hdl>> connections;

    std::shared_ptr<MediaServer::Connection> take(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        if (it == connections.end()) {
            return nullptr;
        }
        auto connection = it->second;
        connections.erase(it);
        return connection;
    }

    std::shared_ptr<MediaServer::Connection> find(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        return it == connections.end() ? nullptr : it->second;
    }
};

MediaServer::MediaServer(std::string host, int port, std::string path, AcceptHandler on_accept)
    : host_(std::move(host)),
      port_(port),
      path_(std::move(path)),
      on_accept_(std::move(on_accept)) {}

MediaServer::~MediaServer() {
    stop();
}

void MediaServer::start() {
    if (running_) {
        return;
    }
    ws_state_ = std::make_unique<WsState>();
    auto& state = *ws_state_;
    auto& server = state.server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_http_handler([&server](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto con = server.get_con_from_hdl(hdl, ec);
        if (!ec) {
            con->set_status(websocketpp::http::status_code::bad_request);
        }
    });
    server.set_validate_handler([this, &server](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto con = server.get_con_from_hdl(hdl, ec);
        if (ec) {
            return false;
        }
        const auto resource = strip_query(con->get_resource());
        if (resource != path_) {
            logging::warn("Media upgrade rejected: unknown path", {kv("path", resource)});
            return false;
        }
        return true;
    });
    server.set_open_handler([this, &state](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto con = state.server.get_con_from_hdl(hdl, ec);
        if (ec) {
            return;
        }
        auto connection_id = con->get_request_header(kCallConnectionHeader);
        if (connection_id.empty()) {
            connection_id = make_connection_id();
        }
        auto connection = std::make_shared<Connection>(state.server, hdl);
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.connections[hdl] = connection;
        }
        logging::info("Media WebSocket accepted",
                      {kv("connection_id", connection_id),
                       kv("remote", con->get_remote_endpoint())});
        handle_open(connection_id, std::move(connection));
    });
    server.set_message_handler([&state](websocketpp::connection_hdl hdl, Server::message_ptr msg) {
        if (auto connection = state.find(hdl)) {
            connection->deliver(msg->get_payload());
        }
    });
    server.set_close_handler([&state](websocketpp::connection_hdl hdl) {
        if (auto connection = state.take(hdl)) {
            connection->peer_closed();
        }
    });
    server.set_fail_handler([&state](websocketpp::connection_hdl hdl) {
        if (auto connection = state.take(hdl)) {
            connection->peer_closed();
        }
    });

    websocketpp::lib::error_code ec;
    server.listen(host_, std::to_string(port_), ec);
    if (ec) {
        throw TransportError("failed to listen on " + host_ + ":" + std::to_string(port_) +
                             ": " + ec.message());
    }
    server.start_accept(ec);
    if (ec) {
        throw TransportError("failed to accept media connections: " + ec.message());
    }
    running_ = true;
    io_thread_ = std::thread([this]() {
        logging::info("Media WebSocket server listening",
                      {kv("host", host_), kv("port", port_), kv("path", path_)});
        try {
            ws_state_->server.run();
        } catch (const std::exception& ex) {
            logging::error("Media WebSocket server loop failed", {kv("error", ex.what())});
        }
    });
}

void MediaServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    auto& state = *ws_state_;
    websocketpp::lib::error_code ec;
    state.server.stop_listening(ec);

    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        for (auto& item : state.connections) {
            open.push_back(item.second);
        }
    }
    for (auto& connection : open) {
        connection->close("server shutdown");
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    state.server.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    logging::info("Media WebSocket server stopped");
}

std::size_t MediaServer::active_connections() const {
    if (!ws_state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    return ws_state_->connections.size();
}

void MediaServer::handle_open(const std::string& connection_id,
                              std::shared_ptr<Connection> connection) {
    reap_finished_workers();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back({std::thread([this, connection_id, connection, done]() {
                            try {
                                on_accept_(connection_id, connection);
                            } catch (const std::exception& ex) {
                                logging::error("Media connection handler failed",
                                               {kv("connection_id", connection_id),
                                                kv("error", ex.what())});
                            }
                            connection->close("session ended");
                            done->store(true);
                        }),
                        done});
}

void MediaServer::reap_finished_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}
