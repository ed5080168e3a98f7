#include "voice_bridge/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.carrier_encoding = get_env_str("CARRIER_ENCODING", "mulaw");
    config.carrier_sample_rate = get_env_int("CARRIER_SAMPLE_RATE", 8000);
    config.frame_ms = get_env_int("FRAME_MS", 20);

    config.speech_debounce_frames = get_env_int("SPEECH_DEBOUNCE_FRAMES", 3);
    config.silence_trail_frames = get_env_int("SILENCE_TRAIL_FRAMES", 25);
    config.max_utterance_ms = get_env_int("MAX_UTTERANCE_MS", 20000);
    config.pre_roll_frames = get_env_int("PRE_ROLL_FRAMES", 10);
    config.min_voiced_ms = get_env_int("MIN_VOICED_MS", 200);
    config.user_silence_timeout_ms = get_env_int("USER_SILENCE_TIMEOUT_MS", 60000);

    config.vad_engine = get_env_str("VAD_ENGINE", "energy");
    config.vad_energy_threshold = get_env_double("VAD_ENERGY_THRESHOLD", 0.02);
    config.vad_adaptive = get_env_bool("VAD_ADAPTIVE", true);
    config.vad_model_path = std::filesystem::path(get_env_str("VAD_MODEL_PATH", cwd.string())) /
                            "silero_vad.onnx";
    config.vad_model_url = get_env_str(
        "VAD_MODEL_URL",
        "https://huggingface.co/onnx-community/silero-vad/resolve/main/onnx/model.onnx");
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);

    config.interruptions_are_allowed = get_env_bool("INTERRUPTIONS_ARE_ALLOWED", true);
    config.stream_partial_responses = get_env_bool("STREAM_PARTIAL_RESPONSES", true);
    config.partial_tts_min_words = get_env_int("PARTIAL_TTS_MIN_WORDS", 5);
    config.turn_deadline_sec = get_env_double("TURN_DEADLINE_SEC", 30.0);
    config.tts_max_inflight = get_env_int("TTS_MAX_INFLIGHT", 2);
    config.max_sessions = get_env_int("MAX_SESSIONS", 32);
    config.record_utterances = get_env_bool("RECORD_UTTERANCES", false);
    config.utterance_audio_dir = get_env_str("UTTERANCE_AUDIO_DIR", (cwd / "utterances").string());

    config.openai_api_key = get_env_str("OPENAI_API_KEY", "");
    config.openai_base_url = get_env_str("OPENAI_BASE_URL", "https://api.openai.com");
    config.stt_model = get_env_str("STT_MODEL", "whisper-1");
    config.stt_language = get_env_str("STT_LANGUAGE", "es");
    config.llm_model = get_env_str("LLM_MODEL", "gpt-4o-mini");
    config.llm_max_tokens = get_env_int("LLM_MAX_TOKENS", 250);
    config.llm_temperature = get_env_double("LLM_TEMPERATURE", 0.2);
    config.system_prompt = get_env_optional("SYSTEM_PROMPT");
    config.tts_model = get_env_str("TTS_MODEL", "gpt-4o-mini-tts");
    config.tts_voice = get_env_str("TTS_VOICE", "alloy");
    config.tts_sample_rate = get_env_int("TTS_SAMPLE_RATE", 24000);
    config.http_connect_timeout = get_env_double("HTTP_CONNECT_TIMEOUT", 10.0);
    config.http_read_timeout = get_env_double("HTTP_READ_TIMEOUT", 60.0);
    config.http_write_timeout = get_env_double("HTTP_WRITE_TIMEOUT", 60.0);

    config.public_host = get_env_optional("PUBLIC_HOST");
    config.media_ws_path = get_env_str("MEDIA_WS_PATH", "/media");
    config.media_ws_port = get_env_int("MEDIA_WS_PORT", 8081);
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.greeting_text = get_env_optional("GREETING_TEXT");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");

    return config;
}

void Config::validate() const {
    if (openai_api_key.empty()) {
        throw std::runtime_error("OPENAI_API_KEY is required");
    }
    if (carrier_encoding != "mulaw" && carrier_encoding != "l16") {
        throw std::runtime_error("CARRIER_ENCODING must be mulaw or l16");
    }
    if (carrier_sample_rate != 8000 && carrier_sample_rate != 16000) {
        throw std::runtime_error("CARRIER_SAMPLE_RATE must be 8000 or 16000");
    }
    if (frame_ms <= 0) {
        throw std::runtime_error("FRAME_MS must be positive");
    }
    if (speech_debounce_frames <= 0) {
        throw std::runtime_error("SPEECH_DEBOUNCE_FRAMES must be positive");
    }
    if (silence_trail_frames <= 0) {
        throw std::runtime_error("SILENCE_TRAIL_FRAMES must be positive");
    }
    if (max_utterance_ms <= frame_ms) {
        throw std::runtime_error("MAX_UTTERANCE_MS must exceed FRAME_MS");
    }
    if (pre_roll_frames < 0) {
        throw std::runtime_error("PRE_ROLL_FRAMES must be zero or positive");
    }
    if (min_voiced_ms < 0) {
        throw std::runtime_error("MIN_VOICED_MS must be zero or positive");
    }
    if (vad_engine != "energy" && vad_engine != "silero") {
        throw std::runtime_error("VAD_ENGINE must be energy or silero");
    }
    if (partial_tts_min_words <= 0) {
        throw std::runtime_error("PARTIAL_TTS_MIN_WORDS must be positive");
    }
    if (tts_max_inflight <= 0) {
        throw std::runtime_error("TTS_MAX_INFLIGHT must be positive");
    }
    if (max_sessions <= 0) {
        throw std::runtime_error("MAX_SESSIONS must be positive");
    }
    if (tts_sample_rate <= 0) {
        throw std::runtime_error("TTS_SAMPLE_RATE must be positive");
    }
    if (media_ws_port <= 0) {
        throw std::runtime_error("MEDIA_WS_PORT must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (media_ws_path.empty() || media_ws_path.front() != '/') {
        throw std::runtime_error("MEDIA_WS_PATH must start with '/'");
    }
}

}
