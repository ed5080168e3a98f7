#pragma once

#include <memory>
#include <string>

#include "voice_bridge/config.hpp"
#include "voice_bridge/session/registry.hpp"

namespace voice_bridge {

class MediaStreamServer {
public:
    MediaStreamServer(const Config& config, SessionRegistry& registry);
    ~MediaStreamServer();

    void start();
    void stop();

    // Session notifications; safe to call from any thread.
    void notify_audio_available(const std::string& call_id);
    void notify_playback_interrupted(const std::string& call_id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
