#pragma once

#include <string>
#include <variant>
#include <vector>

namespace voice_bridge::ai {

struct SessionConfig {
    std::vector<std::string> modalities{"text", "audio"};
    std::string instructions;
    std::string tool_choice = "auto";
    std::string input_audio_format = "pcm16";
    std::string output_audio_format = "pcm16";
};

struct SessionUpdate {
    SessionConfig session;
};

struct InputAudioAppend {
    std::string payload;
};

struct AudioDelta {
    std::string payload;
};

struct TranscriptDelta {
    std::string text;
};

struct Error {
    std::string raw;
};

struct Other {
    std::string type;
};

using Event = std::variant<SessionUpdate,
                           InputAudioAppend,
                           AudioDelta,
                           TranscriptDelta,
                           Error,
                           Other>;

Event parse(const std::string& text);

std::string serialize(const SessionUpdate& event);
std::string serialize(const InputAudioAppend& event);

}
