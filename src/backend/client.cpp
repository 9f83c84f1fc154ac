#include "voice_bridge/backend/client.hpp"

#include <utility>

#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    try {
        utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    } catch (const std::invalid_argument& ex) {
        throw BackendError(ex.what());
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
#else
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else if (scheme_ == "http") {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    } else {
        throw BackendError("Unsupported backend scheme: " + scheme_);
    }
    apply_timeouts();
}

nlohmann::json BackendClient::post_json(const std::string& path,
                                        const nlohmann::json& body,
                                        const std::string& query) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    auto full_path = build_path(path);
    if (!query.empty()) {
        full_path += "?" + query;
    }
    const auto payload = body.dump();
    auto send = [&]() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (client_https_) {
            return client_https_->Post(full_path, headers, payload, "application/json");
        }
#endif
        return client_http_->Post(full_path, headers, payload, "application/json");
    };
    auto response = send();
    if (!response) {
        throw BackendError("Backend request failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("Backend returned status " + std::to_string(response->status) +
                           ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(std::string("Malformed backend response: ") + ex.what());
    }
}

std::string BackendClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

void BackendClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        client_https_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_https_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_https_->set_write_timeout(options_.request_timeout.count(), 0);
        return;
    }
#endif
    if (client_http_) {
        client_http_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_http_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_http_->set_write_timeout(options_.request_timeout.count(), 0);
    }
}

}
