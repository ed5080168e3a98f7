#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge::utils {

std::string base64_encode(const std::uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<std::uint8_t>& data);

// Returns std::nullopt when the input is not valid standard base64.
std::optional<std::vector<std::uint8_t>> base64_decode(const std::string& encoded);

}
