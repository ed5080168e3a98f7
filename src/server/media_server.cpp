#include "voice_bridge/server/media_server.hpp"

#include <atomic>
#include <exception>
#include <map>
#include <thread>
#include <unordered_map>
#include <utility>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/server/twilio.hpp"

namespace voice_bridge {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

struct StreamConnection {
    websocketpp::connection_hdl handle;
    std::string call_id;
    std::string stream_sid;
    bool started = false;
    // Marks sent to the carrier and not yet echoed back.
    uint64_t pending_marks = 0;
    uint64_t mark_counter = 0;
};

using ConnectionPtr = std::shared_ptr<StreamConnection>;

}

struct MediaStreamServer::Impl {
    Impl(const Config& config_in, SessionRegistry& registry_in)
        : config(config_in),
          registry(registry_in),
          encoder(audio::parse_encoding(config_in.carrier_encoding),
                  config_in.carrier_sample_rate) {}

    const Config& config;
    SessionRegistry& registry;
    audio::OutboundEncoder encoder;
    WsServer server;
    std::thread server_thread;
    std::atomic<bool> running{false};

    // Connections are touched only on the websocket io thread.
    std::map<websocketpp::connection_hdl, ConnectionPtr,
             std::owner_less<websocketpp::connection_hdl>> connections;
    std::unordered_map<std::string, ConnectionPtr> by_call;

    void setup();
    bool validate(websocketpp::connection_hdl hdl);
    void on_open(websocketpp::connection_hdl hdl);
    void on_close(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg);

    void handle_start(const ConnectionPtr& connection, const twilio::MediaEvent& event);
    void handle_media(const ConnectionPtr& connection, const twilio::MediaEvent& event);
    void handle_mark(const ConnectionPtr& connection);
    void handle_stop(const ConnectionPtr& connection);
    void end_call(const ConnectionPtr& connection);

    void flush_outbound(const std::string& call_id);
    void clear_playback(const std::string& call_id);
    bool send_json(const ConnectionPtr& connection, const nlohmann::json& payload);
};

void MediaStreamServer::Impl::setup() {
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) { return validate(hdl); });
    server.set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
    server.set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
    server.set_fail_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        on_message(hdl, msg);
    });
}

bool MediaStreamServer::Impl::validate(websocketpp::connection_hdl hdl) {
    auto con = server.get_con_from_hdl(hdl);
    const auto call_id = twilio::call_id_from_resource(con->get_resource(), config.media_ws_path);
    if (!call_id) {
        logging::warn("Media stream rejected: unexpected path",
                      {kv("resource", con->get_resource())});
        return false;
    }
    return true;
}

void MediaStreamServer::Impl::on_open(websocketpp::connection_hdl hdl) {
    auto con = server.get_con_from_hdl(hdl);
    auto connection = std::make_shared<StreamConnection>();
    connection->handle = hdl;
    connection->call_id =
        twilio::call_id_from_resource(con->get_resource(), config.media_ws_path).value_or("");
    connections[hdl] = connection;
    logging::info("Media stream connected", {kv("call_id", connection->call_id)});
}

void MediaStreamServer::Impl::on_close(websocketpp::connection_hdl hdl) {
    const auto it = connections.find(hdl);
    if (it == connections.end()) {
        return;
    }
    auto connection = it->second;
    connections.erase(it);
    end_call(connection);
    logging::info("Media stream closed", {kv("call_id", connection->call_id)});
}

void MediaStreamServer::Impl::on_message(websocketpp::connection_hdl hdl,
                                         WsServer::message_ptr msg) {
    const auto it = connections.find(hdl);
    if (it == connections.end()) {
        return;
    }
    auto connection = it->second;

    twilio::MediaEvent event;
    try {
        event = twilio::parse_event(msg->get_payload());
    } catch (const std::exception& ex) {
        logging::warn("Invalid media stream message",
                      {kv("call_id", connection->call_id), kv("error", ex.what())});
        return;
    }

    switch (event.type) {
        case twilio::EventType::Start:
            handle_start(connection, event);
            break;
        case twilio::EventType::Media:
            handle_media(connection, event);
            break;
        case twilio::EventType::Mark:
            handle_mark(connection);
            break;
        case twilio::EventType::Stop:
            handle_stop(connection);
            break;
        case twilio::EventType::Connected:
            logging::debug("Media stream handshake", {kv("call_id", connection->call_id)});
            break;
        case twilio::EventType::Unknown:
            logging::debug("Ignoring media stream event", {kv("call_id", connection->call_id)});
            break;
    }
}

void MediaStreamServer::Impl::handle_start(const ConnectionPtr& connection,
                                           const twilio::MediaEvent& event) {
    if (connection->started) {
        return;
    }
    connection->stream_sid = event.stream_sid;
    if (!event.call_sid.empty() && event.call_sid != connection->call_id) {
        logging::warn("Stream call id differs from path",
                      {kv("call_id", connection->call_id), kv("call_sid", event.call_sid)});
    }

    std::shared_ptr<CallSession> session;
    try {
        session = registry.create(connection->call_id);
    } catch (const SessionError& ex) {
        logging::error("Media stream refused",
                       {kv("call_id", connection->call_id), kv("error", ex.what())});
        websocketpp::lib::error_code ec;
        server.close(connection->handle, websocketpp::close::status::policy_violation,
                     ex.what(), ec);
        return;
    }
    connection->started = true;
    by_call[connection->call_id] = connection;
    logging::info("Media stream started",
                  {kv("call_id", connection->call_id),
                   kv("stream_sid", connection->stream_sid),
                   kv("encoding", event.encoding),
                   kv("sample_rate", event.sample_rate)});
    if (config.greeting_text) {
        session->speak(*config.greeting_text);
    }
}

void MediaStreamServer::Impl::handle_media(const ConnectionPtr& connection,
                                           const twilio::MediaEvent& event) {
    if (!connection->started) {
        return;
    }
    auto session = registry.find(connection->call_id);
    if (!session) {
        logging::debug("Media for unknown session", {kv("call_id", connection->call_id)});
        return;
    }
    session->on_media_payload(event.payload, event.sequence);
}

void MediaStreamServer::Impl::handle_mark(const ConnectionPtr& connection) {
    if (connection->pending_marks == 0) {
        return;
    }
    --connection->pending_marks;
    if (connection->pending_marks > 0) {
        return;
    }
    if (auto session = registry.find(connection->call_id)) {
        session->on_outbound_drained();
    }
}

void MediaStreamServer::Impl::handle_stop(const ConnectionPtr& connection) {
    logging::info("Media stream stopped", {kv("call_id", connection->call_id)});
    end_call(connection);
}

void MediaStreamServer::Impl::end_call(const ConnectionPtr& connection) {
    if (!connection->started) {
        return;
    }
    connection->started = false;
    by_call.erase(connection->call_id);
    try {
        registry.remove(connection->call_id);
    } catch (const UnknownSessionError& ex) {
        logging::debug("Session already removed",
                       {kv("call_id", connection->call_id), kv("error", ex.what())});
    }
}

void MediaStreamServer::Impl::flush_outbound(const std::string& call_id) {
    const auto it = by_call.find(call_id);
    if (it == by_call.end()) {
        return;
    }
    auto connection = it->second;
    auto session = registry.find(call_id);
    if (!session) {
        return;
    }
    bool sent = false;
    while (auto chunk = session->outbound()->try_pop()) {
        if (!send_json(connection, twilio::media_message(connection->stream_sid,
                                                         encoder.encode(*chunk)))) {
            return;
        }
        sent = true;
    }
    if (!sent) {
        return;
    }
    const auto name = call_id + "-" + std::to_string(++connection->mark_counter);
    if (send_json(connection, twilio::mark_message(connection->stream_sid, name))) {
        ++connection->pending_marks;
    }
}

void MediaStreamServer::Impl::clear_playback(const std::string& call_id) {
    const auto it = by_call.find(call_id);
    if (it == by_call.end()) {
        return;
    }
    auto connection = it->second;
    connection->pending_marks = 0;
    send_json(connection, twilio::clear_message(connection->stream_sid));
    logging::debug("Carrier playback cleared", {kv("call_id", call_id)});
}

bool MediaStreamServer::Impl::send_json(const ConnectionPtr& connection,
                                        const nlohmann::json& payload) {
    websocketpp::lib::error_code ec;
    server.send(connection->handle, payload.dump(), websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::warn("Media stream send failed",
                      {kv("call_id", connection->call_id), kv("error", ec.message())});
        return false;
    }
    return true;
}

MediaStreamServer::MediaStreamServer(const Config& config, SessionRegistry& registry)
    : impl_(std::make_unique<Impl>(config, registry)) {
    impl_->setup();
}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    websocketpp::lib::error_code ec;
    impl_->server.listen(static_cast<uint16_t>(impl_->config.media_ws_port), ec);
    if (ec) {
        impl_->running = false;
        throw std::runtime_error("media stream server failed to listen: " + ec.message());
    }
    impl_->server.start_accept(ec);
    if (ec) {
        impl_->running = false;
        throw std::runtime_error("media stream server failed to accept: " + ec.message());
    }
    impl_->server_thread = std::thread([this]() {
        logging::info("Media stream server listening",
                      {kv("port", impl_->config.media_ws_port),
                       kv("path", impl_->config.media_ws_path)});
        try {
            impl_->server.run();
        } catch (const std::exception& ex) {
            logging::error("Media stream server stopped", {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    websocketpp::lib::error_code ec;
    impl_->server.stop_listening(ec);
    impl_->server.get_io_service().post([impl = impl_.get()]() {
        for (auto& item : impl->connections) {
            websocketpp::lib::error_code close_ec;
            impl->server.close(item.first, websocketpp::close::status::going_away,
                               "shutdown", close_ec);
        }
        impl->server.stop();
    });
    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
}

void MediaStreamServer::notify_audio_available(const std::string& call_id) {
    if (!impl_->running) {
        return;
    }
    impl_->server.get_io_service().post([impl = impl_.get(), call_id]() {
        impl->flush_outbound(call_id);
    });
}

void MediaStreamServer::notify_playback_interrupted(const std::string& call_id) {
    if (!impl_->running) {
        return;
    }
    impl_->server.get_io_service().post([impl = impl_.get(), call_id]() {
        impl->clear_playback(call_id);
    });
}

}
