#include "voice_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::trim(line.substr(0, eq_pos));
        std::string value = utils::trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.media_ws_host = get_env_str("MEDIA_WS_HOST", "0.0.0.0");
    config.media_ws_port = get_env_int("MEDIA_WS_PORT", 8080);
    config.media_ws_path = get_env_str("MEDIA_WS_PATH", "/ws");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);

    config.voicerag_url = get_env_str("VOICERAG_URL", "ws://localhost:8765/realtime");
    config.voicerag_rest_url = get_env_str("VOICERAG_REST_URL", "http://localhost:8765/");
    config.ai_connect_timeout = get_env_int("AI_CONNECT_TIMEOUT", 10);
    config.ai_instructions = get_env_str("AI_INSTRUCTIONS", kDefaultInstructions);

    config.acs_connection_string = get_env_optional("ACS_CONNECTION_STRING");
    config.acs_endpoint = get_env_optional("ACS_ENDPOINT");
    if (!config.acs_endpoint && config.acs_connection_string) {
        config.acs_endpoint =
            utils::connection_string_value(*config.acs_connection_string, "endpoint");
    }
    config.acs_bot_id = get_env_str("ACS_BOT_ID", "");
    config.acs_bot_token = get_env_optional("ACS_BOT_TOKEN");
    config.chat_api_version = get_env_str("CHAT_API_VERSION", "2021-09-07");
    config.chat_dedup_ttl_sec = get_env_int("CHAT_DEDUP_TTL_SEC", 300);

    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 60.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 60.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 60.0);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");

    return config;
}

void Config::validate() const {
    if (voicerag_url.empty()) {
        throw std::runtime_error("VOICERAG_URL is required");
    }
    if (voicerag_url.rfind("ws://", 0) != 0 && voicerag_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("VOICERAG_URL must start with ws:// or wss://");
    }
    if (voicerag_rest_url.empty()) {
        throw std::runtime_error("VOICERAG_REST_URL is required");
    }
    if (media_ws_port <= 0 || media_ws_port > 65535) {
        throw std::runtime_error("MEDIA_WS_PORT must be a valid port");
    }
    if (rest_api_port <= 0 || rest_api_port > 65535) {
        throw std::runtime_error("REST_API_PORT must be a valid port");
    }
    if (media_ws_port == rest_api_port) {
        throw std::runtime_error("MEDIA_WS_PORT and REST_API_PORT must differ");
    }
    if (media_ws_path.empty() || media_ws_path.front() != '/') {
        throw std::runtime_error("MEDIA_WS_PATH must start with '/'");
    }
    if (ai_connect_timeout <= 0) {
        throw std::runtime_error("AI_CONNECT_TIMEOUT must be positive");
    }
    if (chat_dedup_ttl_sec <= 0) {
        throw std::runtime_error("CHAT_DEDUP_TTL_SEC must be positive");
    }
}

bool Config::chat_enabled() const {
    return acs_endpoint.has_value() && acs_bot_token.has_value();
}

}
