#include "voice_bridge/server/rest_server.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/server/twilio.hpp"

namespace voice_bridge {

RestServer::RestServer(const Config& config, SessionsProvider sessions)
    : config_(config),
      sessions_(std::move(sessions)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/incoming", [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(incoming_call_twiml(req), "text/xml");
    });

    server_->Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto ids = sessions_ ? sessions_() : std::vector<std::string>{};
        nlohmann::json payload{{"active", ids.size()}, {"sessions", ids}};
        res.set_content(payload.dump(), "application/json");
    });

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

std::string RestServer::incoming_call_twiml(const httplib::Request& request) const {
    const auto call_sid = request.get_param_value("CallSid");
    if (!config_.public_host) {
        logging::error("Incoming call rejected: PUBLIC_HOST not configured",
                       {kv("call_id", call_sid)});
        return twilio::say_twiml("Server not configured");
    }
    if (call_sid.empty()) {
        logging::warn("Incoming call without CallSid");
        return twilio::say_twiml("Missing call identifier");
    }
    logging::info("Incoming call", {kv("call_id", call_sid),
                                    kv("from", request.get_param_value("From"))});
    Metrics::instance().increment("incoming_call");
    return twilio::stream_twiml(*config_.public_host, config_.media_ws_path, call_sid);
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

}
