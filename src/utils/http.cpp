#include "voice_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = to_lower(working.substr(0, scheme_pos));
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        try {
            port = std::stoi(working.substr(port_pos + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
    } else {
        host = working;
        port = (scheme == "https" || scheme == "wss") ? 443 : 80;
    }
    if (host.empty()) {
        throw std::invalid_argument("missing host in url: " + url);
    }
}

std::string join_path(const std::string& base_path, const std::string& path) {
    if (base_path.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path;
    }
    if (base_path.back() == '/' && path.front() == '/') {
        return base_path + path.substr(1);
    }
    if (base_path.back() != '/' && path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

}
