#include "voice_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace voice_bridge::utils {

namespace {

int default_port(const std::string& scheme) {
    return scheme == "https" || scheme == "wss" ? 443 : 80;
}

}

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    if (port > 0 && port != default_port(scheme)) {
        result += ":" + std::to_string(port);
    }
    return result;
}

Url parse_url(const std::string& url) {
    Url result;
    std::string rest = url;
    result.scheme = "http";

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        result.scheme = rest.substr(0, scheme_end);
        std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        rest.erase(0, scheme_end + 3);
    }

    const auto path_start = rest.find('/');
    result.path = path_start == std::string::npos ? "/" : rest.substr(path_start);
    rest = rest.substr(0, path_start);

    const auto colon = rest.find(':');
    result.host = rest.substr(0, colon);
    if (colon == std::string::npos) {
        result.port = default_port(result.scheme);
    } else {
        try {
            result.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
    }
    if (result.host.empty()) {
        throw std::invalid_argument("missing host in url: " + url);
    }
    return result;
}

}
