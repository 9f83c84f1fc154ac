#include "voice_bridge/server/rest_server.hpp"

#include <stdexcept>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

RestServer::RestServer(std::string host, int port, ChatEventsHandler on_chat_events)
    : host_(std::move(host)),
      port_(port),
      on_chat_events_(std::move(on_chat_events)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/api/chatEvents", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            write_json(res, on_chat_events_(req.body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /api/chatEvents request",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"failed to handle chat events"})", "application/json");
        }
    });

    if (!server_->bind_to_port(host_, port_)) {
        throw std::runtime_error("REST server failed to bind port " + std::to_string(port_));
    }
    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("host", host_), kv("port", port_)});
        server_->listen_after_bind();
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
