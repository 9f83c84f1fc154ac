#pragma once

#include <string>

namespace voice_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);

}
