#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge::twilio {

enum class EventType {
    Connected,
    Start,
    Media,
    Mark,
    Stop,
    Unknown
};

struct MediaEvent {
    EventType type = EventType::Unknown;
    std::string stream_sid;
    std::string call_sid;
    std::string payload;
    uint64_t sequence = 0;
    std::string mark_name;
    std::string encoding;
    int sample_rate = 0;
};

// Throws nlohmann::json::exception on malformed JSON.
MediaEvent parse_event(const std::string& message);

nlohmann::json media_message(const std::string& stream_sid, const std::string& payload_b64);
nlohmann::json mark_message(const std::string& stream_sid, const std::string& name);
nlohmann::json clear_message(const std::string& stream_sid);

std::string stream_twiml(const std::string& public_host,
                         const std::string& ws_path,
                         const std::string& call_sid);
std::string say_twiml(const std::string& text);

// Call id carried in a media stream resource path, e.g. /media/CA123.
std::optional<std::string> call_id_from_resource(const std::string& resource,
                                                 const std::string& ws_path);

std::string xml_escape(const std::string& value);

}
