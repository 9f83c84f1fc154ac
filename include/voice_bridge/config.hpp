#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voice_bridge {

inline constexpr const char* kDefaultInstructions =
    "You are a helpful RAG assistant. Use the search tool to answer questions.";

struct Config {
    std::string media_ws_host = "0.0.0.0";
    int media_ws_port = 8080;
    std::string media_ws_path = "/ws";
    int rest_api_port = 8000;
    std::string voicerag_url = "ws://localhost:8765/realtime";
    std::string voicerag_rest_url = "http://localhost:8765/";
    int ai_connect_timeout = 10;
    std::string ai_instructions = kDefaultInstructions;
    std::optional<std::string> acs_connection_string;
    std::optional<std::string> acs_endpoint;
    std::string acs_bot_id;
    std::optional<std::string> acs_bot_token;
    std::string chat_api_version = "2021-09-07";
    int chat_dedup_ttl_sec = 300;
    double backend_request_timeout = 60.0;
    double backend_connect_timeout = 60.0;
    double backend_sock_read_timeout = 60.0;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;
    bool chat_enabled() const;
};

}
