#include "voice_bridge/relay/session.hpp"

#include <exception>
#include <stdexcept>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

MediaRelaySession::MediaRelaySession(std::string session_id,
                                     std::shared_ptr<transport::MessageChannel> telephony_channel,
                                     AiTransport::Connector ai_connector,
                                     ai::SessionConfig ai_session,
                                     std::shared_ptr<SessionObserver> observer,
                                     media::AudioPacer pacer)
    : session_id_(std::move(session_id)),
      observer_(std::move(observer)),
      pacer_(pacer),
      telephony_(session_id_, std::move(telephony_channel)),
      ai_(session_id_, std::move(ai_connector), std::move(ai_session)) {
    if (!observer_) {
        throw std::invalid_argument("session observer is required");
    }
    cancel_.on_cancel([this]() {
        telephony_.close("session closing");
        ai_.close("session closing");
    });
}

MediaRelaySession::~MediaRelaySession() {
    close("session destroyed");
    join_ai_leg();
}

void MediaRelaySession::run() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_ || state_ != SessionState::Connecting) {
            logging::warn("Session run ignored",
                          {kv("session_id", session_id_), kv("state", to_string(state_))});
            return;
        }
        started_ = true;
        state_ = SessionState::Streaming;
    }
    Metrics::instance().session_started();
    logging::info("Media relay session started", {kv("session_id", session_id_)});
    observer_->on_state_changed(session_id_, SessionState::Streaming);

    std::packaged_task<void()> ai_task([this]() { run_ai_leg(); });
    ai_result_ = ai_task.get_future();
    ai_thread_ = std::thread(std::move(ai_task));

    try {
        const auto reason = telephony_.run_receive_loop(
            [this](const std::string& pcm) { ai_.send_audio(pcm); });
        begin_closing(reason == TelephonyTransport::ExitReason::StopAudio
                          ? "telephony stop audio"
                          : "telephony peer closed");
    } catch (const std::exception& ex) {
        observer_->on_leg_failed(session_id_, "telephony", ex.what());
        begin_closing("telephony failure");
    }

    join_ai_leg();
    finish();
}

void MediaRelaySession::close(const std::string& reason) {
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started = started_;
    }
    begin_closing(reason);
    if (!started) {
        finish();
    }
}

SessionState MediaRelaySession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::string> MediaRelaySession::close_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return close_reason_;
}

void MediaRelaySession::run_ai_leg() {
    try {
        ai_.connect();
        ai_.run_receive_loop(
            pacer_,
            [this](const std::string& frame) { return telephony_.send_audio_frame(frame); },
            *observer_,
            cancel_);
    } catch (...) {
        begin_closing("ai failure");
        throw;
    }
    if (!cancel_.is_cancelled()) {
        telephony_.send_stop_audio();
    }
    begin_closing("ai peer closed");
}

void MediaRelaySession::begin_closing(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closing;
        close_reason_ = reason;
    }
    logging::info("Media relay session closing",
                  {kv("session_id", session_id_), kv("reason", reason)});
    observer_->on_state_changed(session_id_, SessionState::Closing);
    cancel_.cancel();
}

void MediaRelaySession::finish() {
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closed;
        started = started_;
    }
    telephony_.close("session closed");
    ai_.close("session closed");
    if (started) {
        Metrics::instance().session_finished();
    }
    logging::info("Media relay session closed",
                  {kv("session_id", session_id_),
                   kv("reason", close_reason().value_or("unknown"))});
    observer_->on_state_changed(session_id_, SessionState::Closed);
}

void MediaRelaySession::join_ai_leg() {
    if (!ai_thread_.joinable() || ai_thread_.get_id() == std::this_thread::get_id()) {
        return;
    }
    ai_thread_.join();
    if (!ai_result_.valid()) {
        return;
    }
    try {
        ai_result_.get();
    } catch (const std::exception& ex) {
        observer_->on_leg_failed(session_id_, "ai", ex.what());
    }
}

}
