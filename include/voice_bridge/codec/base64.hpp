#pragma once

#include <optional>
#include <string>

namespace voice_bridge::codec {

std::string encode_base64(const std::string& bytes);

std::optional<std::string> decode_base64(const std::string& text);

}
