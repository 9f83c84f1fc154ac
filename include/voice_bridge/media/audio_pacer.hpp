#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {
namespace media {

inline constexpr int kSampleRate = 24000;
inline constexpr int kBytesPerSample = 2;
inline constexpr int kFrameDurationMs = 20;
inline constexpr std::size_t kFrameBytes =
    static_cast<std::size_t>(kSampleRate) * kFrameDurationMs / 1000 * kBytesPerSample;

inline constexpr std::chrono::milliseconds kFrameGap{18};

static_assert(kFrameBytes == 960, "20 ms of 24 kHz PCM16 mono");

class AudioPacer {
public:
    using FrameSink = std::function<bool(const std::string& frame)>;

    explicit AudioPacer(std::size_t frame_bytes = kFrameBytes,
                        std::chrono::milliseconds frame_gap = kFrameGap);

    static std::vector<std::string> split(const std::string& pcm, std::size_t frame_bytes);

    std::size_t play(const std::string& pcm,
                     const FrameSink& sink,
                     const utils::CancellationSignal& cancel) const;


private:
    std::size_t frame_bytes_;
    std::chrono::milliseconds frame_gap_;
};

}
}
