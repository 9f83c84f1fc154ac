#include "voice_bridge/codec/telephony_codec.hpp"

#include <nlohmann/json.hpp>

#include "voice_bridge/codec/base64.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::telephony {

namespace {

constexpr const char* kAudioDataKind = "AudioData";
constexpr const char* kStopAudioKind = "StopAudio";
constexpr const char* kKeepAliveKind = "KeepAlive";

const nlohmann::json* find_either(const nlohmann::json& object,
                                  const char* primary,
                                  const char* fallback) {
    auto it = object.find(primary);
    if (it != object.end() && !it->is_null()) {
        return &*it;
    }
    it = object.find(fallback);
    if (it != object.end() && !it->is_null()) {
        return &*it;
    }
    return nullptr;
}

Envelope parse_audio(const nlohmann::json& packet, const std::string& text) {
    const auto* node = find_either(packet, "audioData", "AudioData");
    const nlohmann::json* data = nullptr;
    if (node && node->is_string()) {
        data = node;
    } else if (node && node->is_object()) {
        auto it = node->find("data");
        if (it != node->end() && it->is_string()) {
            data = &*it;
        }
    }
    if (!data) {
        return AudioData{};
    }
    auto decoded = codec::decode_base64(data->get<std::string>());
    if (!decoded) {
        logging::warn("Telephony audio payload is not valid base64",
                      {kv("length", data->get_ref<const std::string&>().size())});
        return Other{text};
    }
    return AudioData{std::move(*decoded)};
}

}

Envelope parse(const std::string& text) {
    nlohmann::json packet;
    try {
        packet = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        logging::warn("Telephony frame is not valid JSON",
                      {kv("error", ex.what()),
                       kv("frame", utils::truncate_for_log(text, 64))});
        return Other{text};
    }
    if (!packet.is_object()) {
        logging::debug("Telephony frame is not a JSON object");
        return Other{text};
    }

    const auto* kind_node = find_either(packet, "kind", "Kind");
    if (!kind_node || !kind_node->is_string()) {
        logging::debug("Telephony frame has no kind",
                       {kv("frame", utils::truncate_for_log(text, 64))});
        return Other{text};
    }
    const auto& kind = kind_node->get_ref<const std::string&>();
    if (kind == kAudioDataKind) {
        return parse_audio(packet, text);
    }
    if (kind == kStopAudioKind) {
        return StopAudio{};
    }
    if (kind == kKeepAliveKind) {
        return KeepAlive{};
    }
    logging::debug("Telephony frame kind ignored", {kv("kind", kind)});
    return Other{text};
}

std::string serialize(const AudioData& envelope) {
    nlohmann::json packet{
        {"kind", kAudioDataKind},
        {"audioData", {{"data", codec::encode_base64(envelope.payload)}}}};
    return packet.dump();
}

std::string serialize(const StopAudio&) {
    nlohmann::json packet{{"kind", kStopAudioKind}};
    return packet.dump();
}

const char* kind_name(const Envelope& envelope) {
    struct Visitor {
        const char* operator()(const AudioData&) const { return kAudioDataKind; }
        const char* operator()(const StopAudio&) const { return kStopAudioKind; }
        const char* operator()(const KeepAlive&) const { return kKeepAliveKind; }
        const char* operator()(const Other&) const { return "Other"; }
    };
    return std::visit(Visitor{}, envelope);
}

}
