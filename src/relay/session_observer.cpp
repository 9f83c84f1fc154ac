#include "voice_bridge/relay/session_observer.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Streaming:
            return "streaming";
        case SessionState::Closing:
            return "closing";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

void LoggingSessionObserver::on_state_changed(const std::string& session_id,
                                              SessionState state) {
    logging::debug("Session state changed",
                   {kv("session_id", session_id), kv("state", to_string(state))});
}

void LoggingSessionObserver::on_transcript(const std::string& session_id,
                                           const std::string& text) {
    logging::info("Bot transcript", {kv("session_id", session_id), kv("text", text)});
}

void LoggingSessionObserver::on_ai_error(const std::string& session_id,
                                         const std::string& raw) {
    Metrics::instance().increment_ai_error();
    logging::error("AI endpoint reported an error",
                   {kv("session_id", session_id),
                    kv("event", utils::truncate_for_log(raw, 512))});
}

void LoggingSessionObserver::on_leg_failed(const std::string& session_id,
                                           const std::string& leg,
                                           const std::string& error) {
    logging::error("Session leg failed",
                   {kv("session_id", session_id), kv("leg", leg), kv("error", error)});
}

}
