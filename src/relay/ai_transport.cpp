#include "voice_bridge/relay/ai_transport.hpp"

#include <exception>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

AiTransport::AiTransport(std::string session_id,
                         Connector connector,
                         ai::SessionConfig session_config)
    : session_id_(std::move(session_id)),
      connector_(std::move(connector)),
      session_config_(std::move(session_config)) {}

void AiTransport::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
    }
    auto channel = connector_();
    if (!channel) {
        throw transport::TransportError("AI connector returned no channel");
    }
    if (!channel->send_text(ai::serialize(ai::SessionUpdate{session_config_}))) {
        channel->close("session.update failed");
        throw transport::TransportError("failed to send session.update");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            channel->close("session closing");
            return;
        }
        channel_ = channel;
    }
    logging::info("AI session configured", {kv("session_id", session_id_)});
}

void AiTransport::run_receive_loop(const media::AudioPacer& pacer,
                                   const media::AudioPacer::FrameSink& sink,
                                   SessionObserver& observer,
                                   const utils::CancellationSignal& cancel) {
    auto active = channel();
    if (!active) {
        return;
    }
    while (auto message = active->receive()) {
        if (message->empty()) {
            continue;
        }
        try {
            const auto event = ai::parse(*message);
            if (const auto* audio = std::get_if<ai::AudioDelta>(&event)) {
                const auto sent = pacer.play(audio->payload, sink, cancel);
                Metrics::instance().add_frames_played(sent);
                logging::trace("AI audio delta played",
                               {kv("session_id", session_id_),
                                kv("bytes", audio->payload.size()),
                                kv("frames", sent)});
            } else if (const auto* transcript = std::get_if<ai::TranscriptDelta>(&event)) {
                observer.on_transcript(session_id_, transcript->text);
            } else if (const auto* failure = std::get_if<ai::Error>(&event)) {
                observer.on_ai_error(session_id_, failure->raw);
            } else if (const auto* other = std::get_if<ai::Other>(&event)) {
                logging::trace("AI event ignored",
                               {kv("session_id", session_id_), kv("type", other->type)});
            } else {
                logging::debug("Unexpected client event from AI endpoint",
                               {kv("session_id", session_id_)});
            }
        } catch (const std::exception& ex) {
            logging::error("Failed to handle AI event",
                           {kv("session_id", session_id_), kv("error", ex.what())});
        }
    }
    logging::info("AI receive loop finished", {kv("session_id", session_id_)});
}

bool AiTransport::send_audio(const std::string& pcm) {
    auto active = channel();
    if (!active || !active->is_open()) {
        return false;
    }
    if (!active->send_text(ai::serialize(ai::InputAudioAppend{pcm}))) {
        return false;
    }
    Metrics::instance().increment_frames_forwarded();
    return true;
}

void AiTransport::close(const std::string& reason) {
    std::shared_ptr<transport::MessageChannel> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        active = channel_;
    }
    if (active) {
        active->close(reason);
    }
}

std::shared_ptr<transport::MessageChannel> AiTransport::channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

}
