#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/adapters/adapters.hpp"
#include "voice_bridge/adapters/http_client.hpp"

namespace voice_bridge {

struct Config;

struct OpenAiOptions {
    std::string base_url = "https://api.openai.com";
    std::string api_key;
    std::string stt_model = "whisper-1";
    std::string stt_language = "es";
    std::string llm_model = "gpt-4o-mini";
    int llm_max_tokens = 250;
    double llm_temperature = 0.2;
    std::optional<std::string> system_prompt;
    std::string tts_model = "gpt-4o-mini-tts";
    std::string tts_voice = "alloy";
    int tts_sample_rate = 24000;
    int carrier_sample_rate = 8000;
    HttpRequestOptions http;

    static OpenAiOptions from_config(const Config& config);
};

nlohmann::json build_chat_messages(const ConversationHistory& history,
                                   const std::optional<std::string>& system_prompt);

class OpenAiTranscriber : public TranscriptionAdapter {
public:
    OpenAiTranscriber(std::shared_ptr<HttpClient> client, OpenAiOptions options);

    std::string transcribe(const audio::Utterance& utterance,
                           const CancelToken& token) override;

private:
    std::shared_ptr<HttpClient> client_;
    OpenAiOptions options_;
};

class OpenAiResponder : public ResponseAdapter {
public:
    OpenAiResponder(std::shared_ptr<HttpClient> client, OpenAiOptions options);

    std::string generate(const ConversationHistory& history,
                         const CancelToken& token) override;
    TextStream generate_stream(const ConversationHistory& history,
                               const CancelToken& token) override;

private:
    nlohmann::json request_body(const ConversationHistory& history, bool stream) const;

    std::shared_ptr<HttpClient> client_;
    OpenAiOptions options_;
};

class OpenAiSynthesizer : public SynthesisAdapter {
public:
    OpenAiSynthesizer(std::shared_ptr<HttpClient> client, OpenAiOptions options);

    audio::AudioChunk synthesize(const std::string& text,
                                 const CancelToken& token) override;
    AudioStream synthesize_stream(const std::string& text,
                                  const CancelToken& token) override;

private:
    nlohmann::json request_body(const std::string& text) const;

    std::shared_ptr<HttpClient> client_;
    OpenAiOptions options_;
};

struct OpenAiAdapters {
    std::shared_ptr<OpenAiTranscriber> transcriber;
    std::shared_ptr<OpenAiResponder> responder;
    std::shared_ptr<OpenAiSynthesizer> synthesizer;
};

OpenAiAdapters make_openai_adapters(const Config& config);

}
