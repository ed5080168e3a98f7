#include "voice_bridge/adapters/openai.hpp"

#include <exception>
#include <utility>

#include "voice_bridge/adapters/sse.hpp"
#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

namespace {

constexpr int kTranscriptionSampleRate = 16000;
constexpr const char* kTranscriptionsPath = "/v1/audio/transcriptions";
constexpr const char* kChatCompletionsPath = "/v1/chat/completions";
constexpr const char* kSpeechPath = "/v1/audio/speech";

class PcmAccumulator {
public:
    audio::Samples feed(const char* data, size_t size) {
        pending_.append(data, size);
        const size_t usable = pending_.size() - (pending_.size() % 2);
        auto samples = audio::pcm16_from_bytes(pending_.data(), usable);
        pending_.erase(0, usable);
        return samples;
    }

private:
    std::string pending_;
};

}

OpenAiOptions OpenAiOptions::from_config(const Config& config) {
    OpenAiOptions options;
    options.base_url = config.openai_base_url;
    options.api_key = config.openai_api_key;
    options.stt_model = config.stt_model;
    options.stt_language = config.stt_language;
    options.llm_model = config.llm_model;
    options.llm_max_tokens = config.llm_max_tokens;
    options.llm_temperature = config.llm_temperature;
    options.system_prompt = config.system_prompt;
    options.tts_model = config.tts_model;
    options.tts_voice = config.tts_voice;
    options.tts_sample_rate = config.tts_sample_rate;
    options.carrier_sample_rate = config.carrier_sample_rate;
    options.http.connect_timeout = config.http_connect_timeout;
    options.http.read_timeout = config.http_read_timeout;
    options.http.write_timeout = config.http_write_timeout;
    return options;
}

nlohmann::json build_chat_messages(const ConversationHistory& history,
                                   const std::optional<std::string>& system_prompt) {
    auto messages = nlohmann::json::array();
    if (system_prompt && !system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *system_prompt}});
    }
    for (const auto& turn : history.turns()) {
        messages.push_back({{"role", to_string(turn.speaker)}, {"content", turn.text}});
    }
    return messages;
}

OpenAiTranscriber::OpenAiTranscriber(std::shared_ptr<HttpClient> client, OpenAiOptions options)
    : client_(std::move(client)),
      options_(std::move(options)) {}

std::string OpenAiTranscriber::transcribe(const audio::Utterance& utterance,
                                          const CancelToken& token) {
    if (utterance.empty()) {
        throw TranscriptionError("utterance has no audio");
    }
    if (token.is_canceled()) {
        throw TranscriptionError("transcription canceled");
    }
    const auto samples = audio::resample_linear(utterance.samples(), utterance.sample_rate,
                                                kTranscriptionSampleRate);
    const auto wav = audio::encode_wav(samples, kTranscriptionSampleRate);

    httplib::MultipartFormDataItems items;
    items.push_back({"file", wav, "utterance.wav", "audio/wav"});
    items.push_back({"model", options_.stt_model, "", ""});
    if (!options_.stt_language.empty()) {
        items.push_back({"language", options_.stt_language, "", ""});
    }
    items.push_back({"response_format", "json", "", ""});

    try {
        const auto response = client_->post_multipart(kTranscriptionsPath, items);
        return response.value("text", "");
    } catch (const HttpError& ex) {
        throw TranscriptionError(std::string("transcription request failed: ") + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        throw TranscriptionError(std::string("invalid transcription response: ") + ex.what());
    }
}

OpenAiResponder::OpenAiResponder(std::shared_ptr<HttpClient> client, OpenAiOptions options)
    : client_(std::move(client)),
      options_(std::move(options)) {}

nlohmann::json OpenAiResponder::request_body(const ConversationHistory& history,
                                             bool stream) const {
    nlohmann::json body = {
        {"model", options_.llm_model},
        {"messages", build_chat_messages(history, options_.system_prompt)},
        {"max_tokens", options_.llm_max_tokens},
        {"temperature", options_.llm_temperature}
    };
    if (stream) {
        body["stream"] = true;
    }
    return body;
}

std::string OpenAiResponder::generate(const ConversationHistory& history,
                                      const CancelToken& token) {
    if (token.is_canceled()) {
        throw GenerationError("generation canceled");
    }
    try {
        const auto response = client_->post_json(kChatCompletionsPath, request_body(history, false));
        return response.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const HttpError& ex) {
        throw GenerationError(std::string("chat request failed: ") + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        throw GenerationError(std::string("invalid chat response: ") + ex.what());
    }
}

TextStream OpenAiResponder::generate_stream(const ConversationHistory& history,
                                            const CancelToken& token) {
    auto stream = std::make_shared<utils::LazySequence<std::string>>();
    auto client = client_;
    auto body = request_body(history, true);

    utils::run_async([stream, client, body, token]() {
        try {
            SseDecoder decoder;
            bool done = false;
            auto handle_events = [&](const std::vector<std::string>& events) {
                for (const auto& event : events) {
                    if (event == "[DONE]") {
                        done = true;
                        return;
                    }
                    if (auto delta = parse_chat_delta(event)) {
                        if (!delta->empty() && !stream->push(std::move(*delta))) {
                            return;
                        }
                    }
                }
            };
            client->post_stream(kChatCompletionsPath, body,
                                [&](const char* data, size_t size) {
                                    if (token.is_canceled() || stream->canceled()) {
                                        return false;
                                    }
                                    handle_events(decoder.feed(data, size));
                                    return !done;
                                });
            if (!done) {
                handle_events(decoder.finish());
            }
            stream->close();
        } catch (const HttpError& ex) {
            stream->fail(std::make_exception_ptr(
                GenerationError(std::string("chat stream failed: ") + ex.what())));
        } catch (const std::exception& ex) {
            stream->fail(std::make_exception_ptr(GenerationError(ex.what())));
        }
    }, "chat_stream");
    return stream;
}

OpenAiSynthesizer::OpenAiSynthesizer(std::shared_ptr<HttpClient> client, OpenAiOptions options)
    : client_(std::move(client)),
      options_(std::move(options)) {}

nlohmann::json OpenAiSynthesizer::request_body(const std::string& text) const {
    return {
        {"model", options_.tts_model},
        {"voice", options_.tts_voice},
        {"input", text},
        {"response_format", "pcm"}
    };
}

audio::AudioChunk OpenAiSynthesizer::synthesize(const std::string& text,
                                                const CancelToken& token) {
    if (text.empty()) {
        throw SynthesisError("nothing to synthesize");
    }
    PcmAccumulator pcm;
    audio::Samples samples;
    try {
        const bool complete = client_->post_stream(
            kSpeechPath, request_body(text),
            [&](const char* data, size_t size) {
                if (token.is_canceled()) {
                    return false;
                }
                const auto piece = pcm.feed(data, size);
                samples.insert(samples.end(), piece.begin(), piece.end());
                return true;
            });
        if (!complete) {
            throw SynthesisError("synthesis canceled");
        }
    } catch (const HttpError& ex) {
        throw SynthesisError(std::string("speech request failed: ") + ex.what());
    }
    if (samples.empty()) {
        throw SynthesisError("speech response has no audio");
    }
    audio::AudioChunk chunk;
    chunk.generation = token.generation;
    chunk.sample_rate = options_.carrier_sample_rate;
    chunk.samples = audio::resample_linear(samples, options_.tts_sample_rate,
                                           options_.carrier_sample_rate);
    return chunk;
}

AudioStream OpenAiSynthesizer::synthesize_stream(const std::string& text,
                                                 const CancelToken& token) {
    if (text.empty()) {
        throw SynthesisError("nothing to synthesize");
    }
    auto stream = std::make_shared<utils::LazySequence<audio::AudioChunk>>();
    auto client = client_;
    auto body = request_body(text);
    const auto source_rate = options_.tts_sample_rate;
    const auto target_rate = options_.carrier_sample_rate;

    utils::run_async([stream, client, body, token, source_rate, target_rate]() {
        try {
            PcmAccumulator pcm;
            audio::StreamResampler resampler(source_rate, target_rate);
            bool produced = false;
            client->post_stream(kSpeechPath, body, [&](const char* data, size_t size) {
                if (token.is_canceled() || stream->canceled()) {
                    return false;
                }
                auto samples = resampler.process(pcm.feed(data, size));
                if (samples.empty()) {
                    return true;
                }
                audio::AudioChunk chunk;
                chunk.generation = token.generation;
                chunk.sample_rate = target_rate;
                chunk.samples = std::move(samples);
                produced = true;
                return stream->push(std::move(chunk));
            });
            if (!produced && !token.is_canceled()) {
                throw SynthesisError("speech response has no audio");
            }
            stream->close();
        } catch (const HttpError& ex) {
            stream->fail(std::make_exception_ptr(
                SynthesisError(std::string("speech stream failed: ") + ex.what())));
        } catch (const SynthesisError& ex) {
            stream->fail(std::make_exception_ptr(ex));
        } catch (const std::exception& ex) {
            stream->fail(std::make_exception_ptr(SynthesisError(ex.what())));
        }
    }, "speech_stream");
    return stream;
}

OpenAiAdapters make_openai_adapters(const Config& config) {
    const auto options = OpenAiOptions::from_config(config);
    auto client = std::make_shared<HttpClient>(options.base_url, options.api_key, options.http);
    logging::info("Speech engines configured",
                  {kv("base_url", options.base_url),
                   kv("stt_model", options.stt_model),
                   kv("llm_model", options.llm_model),
                   kv("tts_model", options.tts_model),
                   kv("tts_voice", options.tts_voice)});
    OpenAiAdapters adapters;
    adapters.transcriber = std::make_shared<OpenAiTranscriber>(client, options);
    adapters.responder = std::make_shared<OpenAiResponder>(client, options);
    adapters.synthesizer = std::make_shared<OpenAiSynthesizer>(client, options);
    return adapters;
}

}
