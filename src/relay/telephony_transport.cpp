#include "voice_bridge/relay/telephony_transport.hpp"

#include <stdexcept>

#include "voice_bridge/codec/telephony_codec.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

TelephonyTransport::TelephonyTransport(std::string session_id,
                                       std::shared_ptr<transport::MessageChannel> channel)
    : session_id_(std::move(session_id)),
      channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("telephony channel is required");
    }
}

TelephonyTransport::ExitReason TelephonyTransport::run_receive_loop(
    const AudioHandler& on_audio) {
    std::size_t silent_frames = 0;
    while (auto message = channel_->receive()) {
        const auto envelope = telephony::parse(*message);
        if (const auto* audio = std::get_if<telephony::AudioData>(&envelope)) {
            if (audio->is_silent()) {
                ++silent_frames;
                continue;
            }
            on_audio(audio->payload);
        } else if (std::holds_alternative<telephony::StopAudio>(envelope)) {
            logging::info("Telephony requested stop", {kv("session_id", session_id_)});
            return ExitReason::StopAudio;
        } else if (std::holds_alternative<telephony::KeepAlive>(envelope)) {
            logging::trace("Telephony keep-alive", {kv("session_id", session_id_)});
        } else {
            logging::debug("Telephony envelope ignored",
                           {kv("session_id", session_id_),
                            kv("kind", telephony::kind_name(envelope))});
        }
    }
    logging::info("Telephony stream ended",
                  {kv("session_id", session_id_), kv("silent_frames", silent_frames)});
    return ExitReason::PeerClosed;
}

bool TelephonyTransport::send_audio_frame(const std::string& pcm) {
    return channel_->send_text(telephony::serialize(telephony::AudioData{pcm}));
}

bool TelephonyTransport::send_stop_audio() {
    return channel_->send_text(telephony::serialize(telephony::StopAudio{}));
}

void TelephonyTransport::close(const std::string& reason) {
    channel_->close(reason);
}

}
