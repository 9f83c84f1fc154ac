#include "voice_bridge/codec/base64.hpp"

#include <cctype>

#include <websocketpp/base64/base64.hpp>

namespace voice_bridge::codec {

namespace {

bool is_base64_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '+' || ch == '/';
}

bool is_well_formed(const std::string& text) {
    if (text.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(ch)) {
            return false;
        }
    }
    return padding <= 2;
}

}

std::string encode_base64(const std::string& bytes) {
    return websocketpp::base64_encode(bytes);
}

std::optional<std::string> decode_base64(const std::string& text) {
    if (!is_well_formed(text)) {
        return std::nullopt;
    }
    return websocketpp::base64_decode(text);
}

}
