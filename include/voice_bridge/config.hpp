#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voice_bridge {

struct Config {
    std::string carrier_encoding = "mulaw";
    int carrier_sample_rate = 8000;
    int frame_ms = 20;

    int speech_debounce_frames = 3;
    int silence_trail_frames = 25;
    int max_utterance_ms = 20000;
    int pre_roll_frames = 10;
    int min_voiced_ms = 200;
    int user_silence_timeout_ms = 60000;

    std::string vad_engine = "energy";
    double vad_energy_threshold = 0.02;
    bool vad_adaptive = true;
    std::filesystem::path vad_model_path;
    std::string vad_model_url;
    double vad_threshold = 0.5;

    bool interruptions_are_allowed = true;
    bool stream_partial_responses = true;
    int partial_tts_min_words = 5;
    double turn_deadline_sec = 30.0;
    int tts_max_inflight = 2;
    int max_sessions = 32;
    bool record_utterances = false;
    std::filesystem::path utterance_audio_dir;

    std::string openai_api_key;
    std::string openai_base_url = "https://api.openai.com";
    std::string stt_model = "whisper-1";
    std::string stt_language = "es";
    std::string llm_model = "gpt-4o-mini";
    int llm_max_tokens = 250;
    double llm_temperature = 0.2;
    std::optional<std::string> system_prompt;
    std::string tts_model = "gpt-4o-mini-tts";
    std::string tts_voice = "alloy";
    int tts_sample_rate = 24000;
    double http_connect_timeout = 10.0;
    double http_read_timeout = 60.0;
    double http_write_timeout = 60.0;

    std::optional<std::string> public_host;
    std::string media_ws_path = "/media";
    int media_ws_port = 8081;
    int rest_api_port = 8000;
    std::optional<std::string> greeting_text;
    std::optional<std::string> authorization_token;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;
};

}
