#pragma once

#include <string>

namespace voice_bridge::utils {

struct Url {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;

    std::string origin() const;
};

// Throws std::invalid_argument when the url has no host.
Url parse_url(const std::string& url);

}
