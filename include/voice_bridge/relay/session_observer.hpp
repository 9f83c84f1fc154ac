#pragma once

#include <string>

namespace voice_bridge {

enum class SessionState {
    Connecting,
    Streaming,
    Closing,
    Closed
};

const char* to_string(SessionState state);

class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_state_changed(const std::string& session_id, SessionState state) = 0;
    virtual void on_transcript(const std::string& session_id, const std::string& text) = 0;
    virtual void on_ai_error(const std::string& session_id, const std::string& raw) = 0;
    virtual void on_leg_failed(const std::string& session_id,
                               const std::string& leg,
                               const std::string& error) = 0;
};

class LoggingSessionObserver : public SessionObserver {
public:
    void on_state_changed(const std::string& session_id, SessionState state) override;
    void on_transcript(const std::string& session_id, const std::string& text) override;
    void on_ai_error(const std::string& session_id, const std::string& raw) override;
    void on_leg_failed(const std::string& session_id,
                       const std::string& leg,
                       const std::string& error) override;
};

}
