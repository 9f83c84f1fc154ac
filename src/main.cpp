#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice_bridge",
            {voice_bridge::kv("voicerag_url", config.voicerag_url),
             voice_bridge::kv("voicerag_rest_url", config.voicerag_rest_url),
             voice_bridge::kv("media_port", config.media_ws_port),
             voice_bridge::kv("rest_port", config.rest_api_port),
             voice_bridge::kv("chat_enabled", config.chat_enabled())});
        voice_bridge::RelayApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
