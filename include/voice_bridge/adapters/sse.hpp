#pragma once

#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {

class SseDecoder {
public:
    std::vector<std::string> feed(const char* data, size_t size);
    std::vector<std::string> finish();

private:
    void consume_line(std::string line, std::vector<std::string>& events);

    std::string buffer_;
    std::string data_;
    bool has_data_ = false;
};

std::optional<std::string> parse_chat_delta(const std::string& payload);

}
