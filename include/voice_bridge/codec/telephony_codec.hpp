#pragma once

#include <string>
#include <variant>

namespace voice_bridge::telephony {

struct AudioData {
    std::string payload;

    bool is_silent() const { return payload.empty(); }
};

struct StopAudio {};

struct KeepAlive {};

struct Other {
    std::string raw;
};

using Envelope = std::variant<AudioData, StopAudio, KeepAlive, Other>;

Envelope parse(const std::string& text);

std::string serialize(const AudioData& envelope);
std::string serialize(const StopAudio& envelope);

const char* kind_name(const Envelope& envelope);

}
