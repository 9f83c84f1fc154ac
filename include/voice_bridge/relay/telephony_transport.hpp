#pragma once

#include <functional>
#include <memory>
#include <string>

#include "voice_bridge/transport/message_channel.hpp"

namespace voice_bridge {

class TelephonyTransport {
public:
    using AudioHandler = std::function<void(const std::string& pcm)>;

    enum class ExitReason {
        PeerClosed,
        StopAudio
    };

    TelephonyTransport(std::string session_id, std::shared_ptr<transport::MessageChannel> channel);

    ExitReason run_receive_loop(const AudioHandler& on_audio);

    bool send_audio_frame(const std::string& pcm);
    bool send_stop_audio();

    void close(const std::string& reason);

private:
    std::string session_id_;
    std::shared_ptr<transport::MessageChannel> channel_;
};

}
