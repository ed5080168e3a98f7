#pragma once

#include <cstddef>
#include <string>

namespace voice_bridge::utils {

std::string remove_emojis(const std::string& text);
std::string normalize_text(const std::string& text);
std::string trim(const std::string& text);
std::size_t count_words(const std::string& text);
bool is_blank_transcript(const std::string& text);

}
