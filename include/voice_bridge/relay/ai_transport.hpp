#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "voice_bridge/codec/ai_codec.hpp"
#include "voice_bridge/media/audio_pacer.hpp"
#include "voice_bridge/relay/session_observer.hpp"
#include "voice_bridge/transport/message_channel.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

class AiTransport {
public:
    using Connector = std::function<std::shared_ptr<transport::MessageChannel>()>;

    AiTransport(std::string session_id, Connector connector, ai::SessionConfig session_config);

    void connect();

    void run_receive_loop(const media::AudioPacer& pacer,
                          const media::AudioPacer::FrameSink& sink,
                          SessionObserver& observer,
                          const utils::CancellationSignal& cancel);

    bool send_audio(const std::string& pcm);

    void close(const std::string& reason);

private:
    std::shared_ptr<transport::MessageChannel> channel() const;

    std::string session_id_;
    Connector connector_;
    ai::SessionConfig session_config_;
    mutable std::mutex mutex_;
    std::shared_ptr<transport::MessageChannel> channel_;
    bool closed_ = false;
};

}
