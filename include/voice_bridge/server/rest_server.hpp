#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/config.hpp"

namespace voice_bridge {

class RestServer {
public:
    using SessionsProvider = std::function<std::vector<std::string>()>;

    RestServer(const Config& config, SessionsProvider sessions);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    std::string incoming_call_twiml(const httplib::Request& request) const;

    const Config& config_;
    SessionsProvider sessions_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
