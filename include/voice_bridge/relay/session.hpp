#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_bridge/codec/ai_codec.hpp"
#include "voice_bridge/media/audio_pacer.hpp"
#include "voice_bridge/relay/ai_transport.hpp"
#include "voice_bridge/relay/session_observer.hpp"
#include "voice_bridge/relay/telephony_transport.hpp"
#include "voice_bridge/transport/message_channel.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

class MediaRelaySession {
public:
    MediaRelaySession(std::string session_id,
                      std::shared_ptr<transport::MessageChannel> telephony_channel,
                      AiTransport::Connector ai_connector,
                      ai::SessionConfig ai_session,
                      std::shared_ptr<SessionObserver> observer,
                      media::AudioPacer pacer = media::AudioPacer());
    ~MediaRelaySession();

    MediaRelaySession(const MediaRelaySession&) = delete;
    MediaRelaySession& operator=(const MediaRelaySession&) = delete;

    // Blocks until both legs have finished and the session is Closed.
    void run();

    void close(const std::string& reason = "closed by owner");

    SessionState state() const;
    std::optional<std::string> close_reason() const;
    const std::string& id() const { return session_id_; }

private:
    void run_ai_leg();
    void begin_closing(const std::string& reason);
    void finish();
    void join_ai_leg();

    std::string session_id_;
    std::shared_ptr<SessionObserver> observer_;
    media::AudioPacer pacer_;
    utils::CancellationSignal cancel_;
    TelephonyTransport telephony_;
    AiTransport ai_;
    std::thread ai_thread_;
    std::future<void> ai_result_;
    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Connecting;
    std::optional<std::string> close_reason_;
    bool started_ = false;
};

}
