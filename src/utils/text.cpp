#include "voice_bridge/utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace voice_bridge::utils {

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::optional<std::string> connection_string_value(const std::string& connection_string,
                                                   const std::string& key) {
    const auto wanted = to_lower(trim(key));
    std::stringstream stream(connection_string);
    std::string part;
    while (std::getline(stream, part, ';')) {
        const auto eq_pos = part.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        if (to_lower(trim(part.substr(0, eq_pos))) != wanted) {
            continue;
        }
        auto value = trim(part.substr(eq_pos + 1));
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

std::string truncate_for_log(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

}
