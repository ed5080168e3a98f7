#include "voice_bridge/utils/async.hpp"

#include <exception>
#include <thread>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

void run_async(std::function<void()> task, const std::string& name) {
    std::thread worker([task = std::move(task), name]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed",
                           {kv("task", name), kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
