#include "voice_bridge/codec/ai_codec.hpp"

#include <nlohmann/json.hpp>

#include "voice_bridge/codec/base64.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::ai {

namespace {

constexpr const char* kSessionUpdate = "session.update";
constexpr const char* kInputAudioAppend = "input_audio_buffer.append";
constexpr const char* kAudioDelta = "response.audio.delta";
constexpr const char* kTranscriptDelta = "response.audio_transcript.delta";
constexpr const char* kError = "error";

std::string string_field(const nlohmann::json& object, const char* name) {
    auto it = object.find(name);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

SessionConfig parse_session(const nlohmann::json& event) {
    SessionConfig config;
    auto it = event.find("session");
    if (it == event.end() || !it->is_object()) {
        return config;
    }
    const auto& session = *it;
    auto modalities = session.find("modalities");
    if (modalities != session.end() && modalities->is_array()) {
        config.modalities.clear();
        for (const auto& item : *modalities) {
            if (item.is_string()) {
                config.modalities.push_back(item.get<std::string>());
            }
        }
    }
    config.instructions = string_field(session, "instructions");
    if (auto value = string_field(session, "tool_choice"); !value.empty()) {
        config.tool_choice = value;
    }
    if (auto value = string_field(session, "input_audio_format"); !value.empty()) {
        config.input_audio_format = value;
    }
    if (auto value = string_field(session, "output_audio_format"); !value.empty()) {
        config.output_audio_format = value;
    }
    return config;
}

Event decode_audio(const std::string& type, const std::string& encoded) {
    auto decoded = codec::decode_base64(encoded);
    if (!decoded) {
        logging::warn("AI audio payload is not valid base64",
                      {kv("type", type), kv("length", encoded.size())});
        return Other{type};
    }
    if (type == kAudioDelta) {
        return AudioDelta{std::move(*decoded)};
    }
    return InputAudioAppend{std::move(*decoded)};
}

}

Event parse(const std::string& text) {
    nlohmann::json event;
    try {
        event = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        logging::warn("AI event is not valid JSON",
                      {kv("error", ex.what()),
                       kv("event", utils::truncate_for_log(text, 64))});
        return Other{};
    }
    if (!event.is_object()) {
        logging::debug("AI event is not a JSON object");
        return Other{};
    }

    const auto type = string_field(event, "type");
    if (type == kAudioDelta) {
        return decode_audio(type, string_field(event, "delta"));
    }
    if (type == kTranscriptDelta) {
        return TranscriptDelta{string_field(event, "delta")};
    }
    if (type == kError) {
        return Error{text};
    }
    if (type == kInputAudioAppend) {
        return decode_audio(type, string_field(event, "audio"));
    }
    if (type == kSessionUpdate) {
        return SessionUpdate{parse_session(event)};
    }
    return Other{type};
}

std::string serialize(const SessionUpdate& event) {
    const auto& session = event.session;
    nlohmann::json payload{
        {"type", kSessionUpdate},
        {"session",
         {{"modalities", session.modalities},
          {"instructions", session.instructions},
          {"tool_choice", session.tool_choice},
          {"input_audio_format", session.input_audio_format},
          {"output_audio_format", session.output_audio_format}}}};
    return payload.dump();
}

std::string serialize(const InputAudioAppend& event) {
    nlohmann::json payload{
        {"type", kInputAudioAppend},
        {"audio", codec::encode_base64(event.payload)}};
    return payload.dump();
}

}
