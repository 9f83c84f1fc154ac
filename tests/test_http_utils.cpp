#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    REQUIRE(voice_bridge::utils::url_encode("hello world!") == "hello%20world%21");
    REQUIRE(voice_bridge::utils::url_encode("19:abc@thread.v2") == "19%3Aabc%40thread.v2");
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("https://example.com:8443/path/file",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url applies websocket default ports") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_bridge::utils::parse_url("wss://rag.example.com/realtime", scheme, host, port, base_path);
    REQUIRE(scheme == "wss");
    REQUIRE(port == 443);
    REQUIRE(base_path == "/realtime");

    voice_bridge::utils::parse_url("ws://localhost", scheme, host, port, base_path);
    REQUIRE(port == 80);
    REQUIRE(base_path == "/");
}

TEST_CASE("parse_url rejects a missing host or bad port") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    REQUIRE_THROWS_AS(voice_bridge::utils::parse_url("http:///query", scheme, host, port,
                                                     base_path),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(voice_bridge::utils::parse_url("http://host:abc/", scheme, host, port,
                                                     base_path),
                      std::invalid_argument);
}

TEST_CASE("join_path inserts exactly one separator") {
    REQUIRE(voice_bridge::utils::join_path("/", "query") == "/query");
    REQUIRE(voice_bridge::utils::join_path("/api/", "/query") == "/api/query");
    REQUIRE(voice_bridge::utils::join_path("/api", "query") == "/api/query");
    REQUIRE(voice_bridge::utils::join_path("", "query") == "query");
}
