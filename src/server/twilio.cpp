#include "voice_bridge/server/twilio.hpp"

#include <algorithm>
#include <cctype>

namespace voice_bridge::twilio {

namespace {

EventType parse_type(const std::string& name) {
    if (name == "connected") {
        return EventType::Connected;
    }
    if (name == "start") {
        return EventType::Start;
    }
    if (name == "media") {
        return EventType::Media;
    }
    if (name == "mark") {
        return EventType::Mark;
    }
    if (name == "stop") {
        return EventType::Stop;
    }
    return EventType::Unknown;
}

uint64_t parse_sequence(const nlohmann::json& value) {
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (!text.empty() && std::all_of(text.begin(), text.end(),
                                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            return std::stoull(text);
        }
    }
    return 0;
}

std::string strip_scheme(std::string host) {
    for (const char* scheme : {"https://", "http://", "wss://", "ws://"}) {
        const std::string prefix(scheme);
        if (host.rfind(prefix, 0) == 0) {
            host = host.substr(prefix.size());
            break;
        }
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    return host;
}

}

MediaEvent parse_event(const std::string& message) {
    const auto json = nlohmann::json::parse(message);
    MediaEvent event;
    event.type = parse_type(json.value("event", ""));
    event.stream_sid = json.value("streamSid", "");

    switch (event.type) {
        case EventType::Start: {
            const auto& start = json.at("start");
            event.call_sid = start.value("callSid", "");
            if (event.stream_sid.empty()) {
                event.stream_sid = start.value("streamSid", "");
            }
            const auto format = start.find("mediaFormat");
            if (format != start.end() && format->is_object()) {
                event.encoding = format->value("encoding", "");
                event.sample_rate = format->value("sampleRate", 0);
            }
            break;
        }
        case EventType::Media: {
            const auto& media = json.at("media");
            event.payload = media.value("payload", "");
            if (media.contains("chunk")) {
                event.sequence = parse_sequence(media.at("chunk"));
            } else if (json.contains("sequenceNumber")) {
                event.sequence = parse_sequence(json.at("sequenceNumber"));
            }
            break;
        }
        case EventType::Mark: {
            const auto mark = json.find("mark");
            if (mark != json.end() && mark->is_object()) {
                event.mark_name = mark->value("name", "");
            }
            break;
        }
        case EventType::Stop: {
            const auto stop = json.find("stop");
            if (stop != json.end() && stop->is_object()) {
                event.call_sid = stop->value("callSid", "");
            }
            break;
        }
        case EventType::Connected:
        case EventType::Unknown:
            break;
    }
    return event;
}

nlohmann::json media_message(const std::string& stream_sid, const std::string& payload_b64) {
    return {
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", payload_b64}}}
    };
}

nlohmann::json mark_message(const std::string& stream_sid, const std::string& name) {
    return {
        {"event", "mark"},
        {"streamSid", stream_sid},
        {"mark", {{"name", name}}}
    };
}

nlohmann::json clear_message(const std::string& stream_sid) {
    return {
        {"event", "clear"},
        {"streamSid", stream_sid}
    };
}

std::string stream_twiml(const std::string& public_host,
                         const std::string& ws_path,
                         const std::string& call_sid) {
    std::string path = ws_path;
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    const auto url = "wss://" + strip_scheme(public_host) + path + "/" + call_sid;
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<Response><Connect><Stream url=\"" + xml_escape(url) + "\" /></Connect></Response>";
}

std::string say_twiml(const std::string& text) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<Response><Say>" + xml_escape(text) + "</Say></Response>";
}

std::optional<std::string> call_id_from_resource(const std::string& resource,
                                                 const std::string& ws_path) {
    std::string path = resource.substr(0, resource.find('?'));
    std::string prefix = ws_path;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }
    if (path.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    auto call_id = path.substr(prefix.size());
    if (call_id.empty() || call_id.find('/') != std::string::npos) {
        return std::nullopt;
    }
    const bool valid = std::all_of(call_id.begin(), call_id.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '-' || ch == '_';
    });
    if (!valid) {
        return std::nullopt;
    }
    return call_id;
}

std::string xml_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out.push_back(ch);
        }
    }
    return out;
}

}
