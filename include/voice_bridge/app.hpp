#pragma once

#include <atomic>
#include <memory>

#include "voice_bridge/adapters/adapters.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/media_server.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/session/registry.hpp"

namespace voice_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    void run();
    void stop();
    void request_stop();
    const Config& config() const;

private:
    void init_vad();
    void init_adapters();
    std::shared_ptr<CallSession> create_session(const std::string& call_id);

    Config config_;
    SessionConfig session_config_;
    SessionAdapters adapters_;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<MediaStreamServer> media_server_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> stopped_{false};
};

}
