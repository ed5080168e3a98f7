#include "voice_bridge/session/registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

SessionRegistry::SessionRegistry(Factory factory, size_t max_sessions)
    : factory_(std::move(factory)),
      max_sessions_(max_sessions) {
    if (!factory_) {
        throw std::invalid_argument("SessionRegistry requires a session factory");
    }
}

std::shared_ptr<CallSession> SessionRegistry::create(const std::string& call_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(call_id) != 0) {
            throw DuplicateSessionError(call_id);
        }
        if (max_sessions_ > 0 && sessions_.size() >= max_sessions_) {
            throw SessionLimitError("session limit reached (" +
                                    std::to_string(max_sessions_) + ")");
        }
        sessions_.emplace(call_id, nullptr);
    }

    std::shared_ptr<CallSession> session;
    try {
        session = factory_(call_id);
    } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(call_id);
        logging::error("Session creation failed",
                       {kv("call_id", call_id), kv("error", ex.what())});
        throw;
    }
    if (!session) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(call_id);
        throw SessionError("session factory returned no session for " + call_id);
    }

    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[call_id] = session;
        active = sessions_.size();
    }
    Metrics::instance().set_active_sessions(active);
    Metrics::instance().increment("call_started");
    logging::info("Session registered", {kv("call_id", call_id), kv("active", active)});
    return session;
}

std::shared_ptr<CallSession> SessionRegistry::get(const std::string& call_id) const {
    auto session = find(call_id);
    if (!session) {
        throw UnknownSessionError(call_id);
    }
    return session;
}

std::shared_ptr<CallSession> SessionRegistry::find(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(call_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void SessionRegistry::remove(const std::string& call_id) {
    std::shared_ptr<CallSession> session;
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(call_id);
        if (it == sessions_.end() || !it->second) {
            throw UnknownSessionError(call_id);
        }
        session = std::move(it->second);
        sessions_.erase(it);
        active = sessions_.size();
    }
    session->end();
    Metrics::instance().set_active_sessions(active);
    Metrics::instance().increment("call_ended");
    logging::info("Session removed", {kv("call_id", call_id), kv("active", active)});
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(sessions_.size());
        for (const auto& item : sessions_) {
            if (item.second) {
                result.push_back(item.first);
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void SessionRegistry::end_all() {
    std::unordered_map<std::string, std::shared_ptr<CallSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& item : sessions) {
        if (item.second) {
            item.second->end();
        }
    }
    Metrics::instance().set_active_sessions(0);
    if (!sessions.empty()) {
        logging::info("All sessions ended", {kv("count", sessions.size())});
    }
}

}
