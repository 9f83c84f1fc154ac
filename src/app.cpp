#include "voice_bridge/app.hpp"

#include <chrono>
#include <csignal>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/relay/session.hpp"
#include "voice_bridge/relay/session_observer.hpp"
#include "voice_bridge/transport/ws_client.hpp"

namespace voice_bridge {

namespace {

BackendRequestOptions backend_options(const Config& config) {
    BackendRequestOptions options;
    options.request_timeout =
        std::chrono::seconds(static_cast<long>(config.backend_request_timeout));
    options.connect_timeout =
        std::chrono::seconds(static_cast<long>(config.backend_connect_timeout));
    options.sock_read_timeout =
        std::chrono::seconds(static_cast<long>(config.backend_sock_read_timeout));
    return options;
}

}

RelayApp::RelayApp(Config config)
    : config_(std::move(config)),
      dedup_store_(std::chrono::seconds(config_.chat_dedup_ttl_sec)),
      rag_backend_(config_.voicerag_rest_url, std::nullopt, backend_options(config_)),
      rag_client_(rag_backend_) {}

RelayApp::~RelayApp() {
    stop();
}

void RelayApp::init() {
    init_chat();

    rest_server_ = std::make_unique<RestServer>(
        "0.0.0.0", config_.rest_api_port,
        [this](const std::string& body) {
            const auto reply = chat_webhook_->handle(body);
            return RestResponse{reply.status, reply.body};
        });

    media_server_ = std::make_unique<transport::MediaServer>(
        config_.media_ws_host, config_.media_ws_port, config_.media_ws_path,
        [this](const std::string& connection_id,
               std::shared_ptr<transport::MessageChannel> channel) {
            handle_media_connection(connection_id, std::move(channel));
        });
}

void RelayApp::init_chat() {
    if (!config_.chat_enabled()) {
        logging::warn("Chat bridge disabled; ACS_ENDPOINT and ACS_BOT_TOKEN are required");
        chat_webhook_ = std::make_unique<chat::ChatWebhook>(nullptr);
        return;
    }
    chat_backend_ = std::make_unique<BackendClient>(*config_.acs_endpoint,
                                                    config_.acs_bot_token,
                                                    backend_options(config_));
    chat_client_ = std::make_unique<chat::AcsChatClient>(*chat_backend_,
                                                         config_.chat_api_version);
    chat_bridge_ = std::make_unique<chat::ChatBridge>(dedup_store_, rag_client_,
                                                      *chat_client_, config_.acs_bot_id);
    chat_webhook_ = std::make_unique<chat::ChatWebhook>(chat_bridge_.get());
    logging::info("Chat bridge enabled", {kv("endpoint", *config_.acs_endpoint)});
}

void RelayApp::run() {
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            logging::info("Shutdown signal received", {kv("signal", signal_number)});
        }
    });

    rest_server_->start();
    media_server_->start();
    logging::info("voice_bridge running",
                  {kv("media_port", config_.media_ws_port),
                   kv("media_path", config_.media_ws_path),
                   kv("rest_port", config_.rest_api_port)});

    signals_context.run();
    stop();
}

void RelayApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (media_server_) {
        logging::info("Stopping media server",
                      {kv("active_connections", media_server_->active_connections())});
        media_server_->stop();
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    logging::info("voice_bridge stopped");
}

void RelayApp::handle_media_connection(const std::string& connection_id,
                                       std::shared_ptr<transport::MessageChannel> channel) {
    const auto url = config_.voicerag_url;
    const auto timeout = std::chrono::seconds(config_.ai_connect_timeout);
    ai::SessionConfig session_config;
    session_config.instructions = config_.ai_instructions;

    MediaRelaySession session(
        connection_id, std::move(channel),
        [url, timeout]() { return transport::connect_websocket(url, timeout); },
        std::move(session_config),
        std::make_shared<LoggingSessionObserver>());
    session.run();
}

}
