#include "voice_bridge/app.hpp"

#include <chrono>
#include <thread>

#include "voice_bridge/adapters/openai.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/vad/detector.hpp"

namespace voice_bridge {

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      session_config_(SessionConfig::from_config(config_)) {}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::init() {
    init_vad();
    init_adapters();

    registry_ = std::make_unique<SessionRegistry>(
        [this](const std::string& call_id) { return create_session(call_id); },
        static_cast<size_t>(config_.max_sessions));
    media_server_ = std::make_unique<MediaStreamServer>(config_, *registry_);
    rest_server_ = std::make_unique<RestServer>(config_, [this]() { return registry_->ids(); });

    media_server_->start();
    rest_server_->start();
}

void BridgeApp::run() {
    while (!quitting_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    stop();
}

void BridgeApp::request_stop() {
    quitting_ = true;
}

void BridgeApp::stop() {
    quitting_ = true;
    if (stopped_.exchange(true)) {
        return;
    }
    logging::info("Shutting down", {kv("sessions", registry_ ? registry_->size() : 0)});
    if (rest_server_) {
        rest_server_->stop();
    }
    if (media_server_) {
        media_server_->stop();
    }
    if (registry_) {
        registry_->end_all();
    }
}

const Config& BridgeApp::config() const {
    return config_;
}

void BridgeApp::init_vad() {
    auto probe = vad::make_detector(config_);
    probe->reset();
    logging::info("Voice activity detector ready", {kv("engine", config_.vad_engine)});
}

void BridgeApp::init_adapters() {
    auto openai = make_openai_adapters(config_);
    adapters_.transcriber = openai.transcriber;
    adapters_.responder = openai.responder;
    adapters_.synthesizer = openai.synthesizer;
}

std::shared_ptr<CallSession> BridgeApp::create_session(const std::string& call_id) {
    SessionCallbacks callbacks;
    callbacks.on_audio_available = [this](const std::string& id) {
        media_server_->notify_audio_available(id);
    };
    callbacks.on_playback_interrupted = [this](const std::string& id) {
        media_server_->notify_playback_interrupted(id);
    };
    callbacks.on_silence_timeout = [](const std::string& id) {
        logging::info("Caller silent", {kv("call_id", id)});
    };
    callbacks.on_state_changed = [](const std::string& id, CallState state) {
        logging::debug("Call state", {kv("call_id", id), kv("state", to_string(state))});
    };
    return CallSession::create(call_id, session_config_, adapters_,
                               vad::make_detector(config_), std::move(callbacks));
}

}
