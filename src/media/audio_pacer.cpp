#include "voice_bridge/media/audio_pacer.hpp"

#include <algorithm>
#include <stdexcept>

namespace voice_bridge {
namespace media {

AudioPacer::AudioPacer(std::size_t frame_bytes, std::chrono::milliseconds frame_gap)
    : frame_bytes_(frame_bytes),
      frame_gap_(frame_gap) {
    if (frame_bytes_ == 0) {
        throw std::invalid_argument("frame_bytes must be positive");
    }
}

std::vector<std::string> AudioPacer::split(const std::string& pcm, std::size_t frame_bytes) {
    std::vector<std::string> frames;
    if (pcm.empty() || frame_bytes == 0) {
        return frames;
    }
    frames.reserve((pcm.size() + frame_bytes - 1) / frame_bytes);
    for (std::size_t offset = 0; offset < pcm.size(); offset += frame_bytes) {
        const auto length = std::min(frame_bytes, pcm.size() - offset);
        frames.push_back(pcm.substr(offset, length));
    }
    return frames;
}

std::size_t AudioPacer::play(const std::string& pcm,
                             const FrameSink& sink,
                             const utils::CancellationSignal& cancel) const {
    std::size_t sent = 0;
    for (const auto& frame : split(pcm, frame_bytes_)) {
        if (cancel.is_cancelled()) {
            break;
        }
        if (!sink(frame)) {
            break;
        }
        ++sent;
        if (cancel.wait_for(frame_gap_)) {
            break;
        }
    }
    return sent;
}

}
}
