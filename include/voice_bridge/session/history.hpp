#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace voice_bridge {

enum class Speaker {
    User,
    Assistant
};

inline const char* to_string(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "assistant";
}

struct ConversationTurn {
    Speaker speaker;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

class ConversationHistory {
public:
    const ConversationTurn& append(Speaker speaker, std::string text) {
        turns_.push_back({speaker, std::move(text), std::chrono::system_clock::now()});
        return turns_.back();
    }

    const std::vector<ConversationTurn>& turns() const { return turns_; }
    size_t size() const { return turns_.size(); }
    bool empty() const { return turns_.empty(); }
    const ConversationTurn& back() const { return turns_.back(); }

private:
    std::vector<ConversationTurn> turns_;
};

}
