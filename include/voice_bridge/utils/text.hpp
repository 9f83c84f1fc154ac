#pragma once

#include <optional>
#include <string>

namespace voice_bridge::utils {

std::string trim(std::string value);
std::string to_lower(std::string value);

std::optional<std::string> connection_string_value(const std::string& connection_string,
                                                   const std::string& key);

std::string truncate_for_log(const std::string& text, size_t limit = 256);

}
