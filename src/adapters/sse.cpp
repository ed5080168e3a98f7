#include "voice_bridge/adapters/sse.hpp"

#include <nlohmann/json.hpp>

namespace voice_bridge {

std::vector<std::string> SseDecoder::feed(const char* data, size_t size) {
    std::vector<std::string> events;
    buffer_.append(data, size);
    size_t start = 0;
    while (true) {
        const auto newline = buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = buffer_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        consume_line(std::move(line), events);
        start = newline + 1;
    }
    buffer_.erase(0, start);
    return events;
}

std::vector<std::string> SseDecoder::finish() {
    std::vector<std::string> events;
    if (!buffer_.empty()) {
        consume_line(std::move(buffer_), events);
        buffer_.clear();
    }
    consume_line(std::string(), events);
    return events;
}

void SseDecoder::consume_line(std::string line, std::vector<std::string>& events) {
    if (line.empty()) {
        if (has_data_) {
            events.push_back(std::move(data_));
            data_.clear();
            has_data_ = false;
        }
        return;
    }
    if (line.front() == ':') {
        return;
    }
    if (line.compare(0, 5, "data:") != 0) {
        return;
    }
    std::string value = line.substr(5);
    if (!value.empty() && value.front() == ' ') {
        value.erase(value.begin());
    }
    if (has_data_) {
        data_ += '\n';
    }
    data_ += value;
    has_data_ = true;
}

std::optional<std::string> parse_chat_delta(const std::string& payload) {
    const auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    const auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array() || choices->empty()) {
        return std::nullopt;
    }
    const auto& choice = choices->front();
    const auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) {
        return std::nullopt;
    }
    const auto content = delta->find("content");
    if (content == delta->end() || !content->is_string()) {
        return std::nullopt;
    }
    return content->get<std::string>();
}

}
