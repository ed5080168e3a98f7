#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_signaled{false};

void handle_signal(int) {
    g_signaled = true;
}

}

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("media_port", config.media_ws_port),
             voice_bridge::kv("media_path", config.media_ws_path),
             voice_bridge::kv("rest_port", config.rest_api_port),
             voice_bridge::kv("encoding", config.carrier_encoding),
             voice_bridge::kv("sample_rate", config.carrier_sample_rate),
             voice_bridge::kv("vad_engine", config.vad_engine),
             voice_bridge::kv("interruptions_allowed", config.interruptions_are_allowed)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        voice_bridge::BridgeApp app(config);
        app.init();
        std::thread watcher([&app]() {
            while (!g_signaled) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            app.request_stop();
        });
        app.run();
        g_signaled = true;
        watcher.join();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
