#include "voice_bridge/transport/ws_client.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

#include <openssl/ssl.h>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/transport/message_queue.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::transport {

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;
using SslStream = websocketpp::lib::asio::ssl::stream<websocketpp::lib::asio::ip::tcp::socket>;

void configure_tls(PlainClient&, const std::string&) {}

void configure_tls(TlsClient& client, const std::string& host) {
    client.set_tls_init_handler([host](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tls_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3 | SslContext::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        context->set_verify_callback(websocketpp::lib::asio::ssl::rfc2818_verification(host));
        return context;
    });
    client.set_socket_init_handler([host](websocketpp::connection_hdl, SslStream& stream) {
        SSL_set_tlsext_host_name(stream.native_handle(), host.c_str());
    });
}

}

class WsClientChannel::Endpoint {
public:
    virtual ~Endpoint() = default;
    virtual void connect(const std::string& url, std::chrono::seconds timeout) = 0;
    virtual bool send_text(const std::string& text) = 0;
    virtual std::optional<std::string> receive() = 0;
    virtual void close(const std::string& reason) = 0;
    virtual bool is_open() const = 0;
};

namespace {

template <typename Client>
class BasicEndpoint : public WsClientChannel::Endpoint {
public:
    explicit BasicEndpoint(std::string host) : host_(std::move(host)) {}

    ~BasicEndpoint() override {
        close("shutdown");
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void connect(const std::string& url, std::chrono::seconds timeout) override {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        client_.set_open_handshake_timeout(
            std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
        configure_tls(client_, host_);

        client_.set_open_handler([this](websocketpp::connection_hdl) {
            open_ = true;
            settle(true, {});
        });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
            std::string reason = "connection failed";
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec && con) {
                reason = con->get_ec().message();
            }
            open_ = false;
            settle(false, reason);
            queue_.finish();
        });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec && con) {
                logging::debug("WebSocket closed by peer",
                               {kv("code", con->get_remote_close_code()),
                                kv("reason", con->get_remote_close_reason())});
            }
            open_ = false;
            queue_.finish();
        });
        client_.set_message_handler([this](websocketpp::connection_hdl,
                                           typename Client::message_ptr msg) {
            queue_.push(msg->get_payload());
        });

        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(url, ec);
        if (ec) {
            throw TransportError("invalid websocket url " + url + ": " + ec.message());
        }
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            connection_ = con->get_handle();
        }
        auto opened = handshake_.get_future();
        client_.connect(con);
        worker_ = std::thread([this]() {
            try {
                client_.run();
            } catch (const std::exception& ex) {
                logging::error("WebSocket client loop failed", {kv("error", ex.what())});
            }
            open_ = false;
            settle(false, "event loop stopped");
            queue_.finish();
        });

        if (opened.wait_for(timeout) != std::future_status::ready) {
            close("connect timeout");
            throw TransportError("timed out connecting to " + url);
        }
        const auto result = opened.get();
        if (!result.first) {
            throw TransportError("failed to connect to " + url + ": " + result.second);
        }
    }

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!open_ || connection_.expired()) {
            return false;
        }
        websocketpp::lib::error_code ec;
        client_.send(connection_, text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::debug("WebSocket send failed", {kv("error", ec.message())});
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
        if (closing_) {
            return;
        }
        closing_ = true;
        websocketpp::lib::error_code ec;
        if (open_ && !connection_.expired()) {
            client_.close(connection_, websocketpp::close::status::normal, reason, ec);
        }
        if (!open_ || ec) {
            client_.stop();
        }
        open_ = false;
    }

    bool is_open() const override {
        return open_;
    }

private:
    void settle(bool ok, std::string reason) {
        std::lock_guard<std::mutex> lock(settle_mutex_);
        if (settled_) {
            return;
        }
        settled_ = true;
        handshake_.set_value({ok, std::move(reason)});
    }

    std::string host_;
    Client client_;
    std::thread worker_;
    mutable std::mutex ws_mutex_;
    websocketpp::connection_hdl connection_;
    std::atomic<bool> open_{false};
    bool closing_ = false;
    MessageQueue queue_;
    std::mutex settle_mutex_;
    bool settled_ = false;
    std::promise<std::pair<bool, std::string>> handshake_;
};

}

WsClientChannel::WsClientChannel(std::string url, std::chrono::seconds connect_timeout)
    : url_(std::move(url)),
      connect_timeout_(connect_timeout) {
    std::string scheme;
    std::string host;
    std::string path;
    int port = 0;
    utils::parse_url(url_, scheme, host, port, path);
    if (scheme == "wss") {
        endpoint_ = std::make_unique<BasicEndpoint<TlsClient>>(host);
    } else if (scheme == "ws") {
        endpoint_ = std::make_unique<BasicEndpoint<PlainClient>>(host);
    } else {
        throw TransportError("unsupported websocket scheme: " + scheme);
    }
}

WsClientChannel::~WsClientChannel() = default;

void WsClientChannel::connect() {
    endpoint_->connect(url_, connect_timeout_);
    logging::info("Connected to WebSocket endpoint", {kv("url", url_)});
}

bool WsClientChannel::send_text(const std::string& text) {
    return endpoint_->send_text(text);
}

std::optional<std::string> WsClientChannel::receive() {
    return endpoint_->receive();
}

void WsClientChannel::close(const std::string& reason) {
    endpoint_->close(reason);
}

bool WsClientChannel::is_open() const {
    return endpoint_->is_open();
}

std::shared_ptr<MessageChannel> connect_websocket(const std::string& url,
                                                  std::chrono::seconds connect_timeout) {
    auto channel = std::make_shared<WsClientChannel>(url, connect_timeout);
    channel->connect();
    return channel;
}

}
