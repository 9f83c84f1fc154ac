#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/text.hpp"

#include <string>

TEST_CASE("trim removes surrounding whitespace") {
    REQUIRE(voice_bridge::utils::trim("  \tvalue \n") == "value");
    REQUIRE(voice_bridge::utils::trim("   ").empty());
}

TEST_CASE("connection_string_value finds keys case-insensitively") {
    const std::string cs =
        "endpoint=https://acs.example.com/;accesskey=c2VjcmV0PT0=";
    REQUIRE(voice_bridge::utils::connection_string_value(cs, "Endpoint") ==
            "https://acs.example.com/");
    REQUIRE(voice_bridge::utils::connection_string_value(cs, "accessKey") == "c2VjcmV0PT0=");
}

TEST_CASE("connection_string_value reports missing or empty keys") {
    REQUIRE_FALSE(voice_bridge::utils::connection_string_value("a=1;b=2", "endpoint"));
    REQUIRE_FALSE(voice_bridge::utils::connection_string_value("endpoint=;b=2", "endpoint"));
    REQUIRE_FALSE(voice_bridge::utils::connection_string_value("", "endpoint"));
}

TEST_CASE("truncate_for_log shortens long text") {
    const std::string text(300, 'x');
    const auto truncated = voice_bridge::utils::truncate_for_log(text, 10);
    REQUIRE(truncated == "xxxxxxxxxx...");
    REQUIRE(voice_bridge::utils::truncate_for_log("short", 10) == "short");
}
