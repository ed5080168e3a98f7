#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "voice_bridge/session/call_session.hpp"

namespace voice_bridge {

class SessionRegistry {
public:
    using Factory = std::function<std::shared_ptr<CallSession>(const std::string& call_id)>;

    SessionRegistry(Factory factory, size_t max_sessions);

    // Throws DuplicateSessionError or SessionLimitError.
    std::shared_ptr<CallSession> create(const std::string& call_id);
    std::shared_ptr<CallSession> get(const std::string& call_id) const;
    std::shared_ptr<CallSession> find(const std::string& call_id) const;
    // Ends the session and drops it. Throws UnknownSessionError.
    void remove(const std::string& call_id);

    size_t size() const;
    std::vector<std::string> ids() const;
    void end_all();

private:
    Factory factory_;
    size_t max_sessions_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CallSession>> sessions_;
};

}
