#include "voice_bridge/session/call_session.hpp"

#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/async.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool produces_output(CallState state) {
    return state == CallState::Synthesizing || state == CallState::Speaking;
}

bool awaits_reply(CallState state) {
    return state == CallState::Generating || produces_output(state);
}

}

const char* to_string(CallState state) {
    switch (state) {
        case CallState::Idle:
            return "idle";
        case CallState::Listening:
            return "listening";
        case CallState::Transcribing:
            return "transcribing";
        case CallState::Generating:
            return "generating";
        case CallState::Synthesizing:
            return "synthesizing";
        case CallState::Speaking:
            return "speaking";
        case CallState::Ended:
            return "ended";
    }
    return "unknown";
}

SessionConfig SessionConfig::from_config(const Config& config) {
    SessionConfig result;
    result.segment = SegmentConfig::from_config(config);
    result.encoding = audio::parse_encoding(config.carrier_encoding);
    result.sample_rate = config.carrier_sample_rate;
    result.interruptions_are_allowed = config.interruptions_are_allowed;
    result.stream_partial_responses = config.stream_partial_responses;
    result.partial_tts_min_words = config.partial_tts_min_words;
    result.turn_deadline_sec = config.turn_deadline_sec;
    result.tts_max_inflight = config.tts_max_inflight;
    result.record_utterances = config.record_utterances;
    result.utterance_audio_dir = config.utterance_audio_dir;
    return result;
}

std::shared_ptr<CallSession> CallSession::create(std::string id,
                                                 SessionConfig config,
                                                 SessionAdapters adapters,
                                                 std::unique_ptr<vad::VoiceActivityDetector> detector,
                                                 SessionCallbacks callbacks) {
    std::shared_ptr<CallSession> session(new CallSession(std::move(id),
                                                         std::move(config),
                                                         std::move(adapters),
                                                         std::move(detector),
                                                         std::move(callbacks)));
    std::weak_ptr<CallSession> weak = session;
    auto synthesizer = session->adapters_.synthesizer;

    session->pipeline_ = std::make_shared<SynthesisPipeline>(
        session->config_.tts_max_inflight,
        [synthesizer](const std::string& text, const CancelToken& token) {
            return synthesizer->synthesize_stream(text, token);
        },
        [weak](audio::AudioChunk chunk) {
            if (auto self = weak.lock()) {
                self->handle_chunk(std::move(chunk));
            }
        },
        [weak]() {
            if (auto self = weak.lock()) {
                self->post([](CallSession& session) { session.pump_synthesis(); });
            }
        });

    logging::info("Call session created",
                  {kv("call_id", session->id_),
                   kv("encoding", audio::to_string(session->config_.encoding)),
                   kv("sample_rate", session->config_.sample_rate)});
    return session;
}

CallSession::CallSession(std::string id,
                         SessionConfig config,
                         SessionAdapters adapters,
                         std::unique_ptr<vad::VoiceActivityDetector> detector,
                         SessionCallbacks callbacks)
    : id_(std::move(id)),
      config_(std::move(config)),
      adapters_(std::move(adapters)),
      callbacks_(std::move(callbacks)),
      decoder_(config_.encoding, config_.sample_rate),
      segments_(config_.segment, std::move(detector), id_),
      queue_(std::make_unique<utils::TaskQueue>("session-" + id_)),
      outbound_(std::make_shared<OutboundAudioQueue>()) {
    if (!adapters_.transcriber || !adapters_.responder || !adapters_.synthesizer) {
        throw std::invalid_argument("CallSession requires all three adapters");
    }
}

CallSession::~CallSession() {
    queue_->stop();
    if (pipeline_) {
        pipeline_->cancel();
    }
}

bool CallSession::post(std::function<void(CallSession&)> handler) {
    std::weak_ptr<CallSession> weak = weak_from_this();
    return queue_->post([weak, handler = std::move(handler)]() {
        if (auto self = weak.lock()) {
            handler(*self);
        }
    });
}

bool CallSession::on_media_payload(const std::string& payload_b64, uint64_t sequence) {
    if (state() == CallState::Ended) {
        logging::debug("Media after call end ignored", {kv("call_id", id_)});
        return false;
    }
    audio::AudioFrame frame;
    try {
        frame = decoder_.decode(payload_b64, sequence);
    } catch (const MalformedFrameError& ex) {
        Metrics::instance().increment("malformed_frame");
        logging::warn("Malformed media frame skipped",
                      {kv("call_id", id_),
                       kv("sequence", sequence),
                       kv("error", ex.what())});
        return false;
    }
    return on_audio_frame(std::move(frame));
}

bool CallSession::on_audio_frame(audio::AudioFrame frame) {
    const auto sequence = frame.sequence;
    const bool posted = post([frame = std::move(frame)](CallSession& session) {
        session.handle_frame(frame);
    });
    if (!posted) {
        logging::debug("Frame after call end ignored",
                       {kv("call_id", id_), kv("sequence", sequence)});
    }
    return posted;
}

void CallSession::on_transcript_ready(uint64_t generation, std::string text) {
    post([generation, text = std::move(text)](CallSession& session) {
        session.handle_transcript(generation, text);
    });
}

void CallSession::on_response_fragment(uint64_t generation, std::string fragment) {
    post([generation, fragment = std::move(fragment)](CallSession& session) {
        session.handle_fragment(generation, fragment);
    });
}

void CallSession::on_response_complete(uint64_t generation, std::string text) {
    post([generation, text = std::move(text)](CallSession& session) {
        session.handle_complete(generation, text);
    });
}

void CallSession::on_audio_chunk_ready(audio::AudioChunk chunk) {
    post([chunk = std::move(chunk)](CallSession& session) mutable {
        session.handle_chunk(std::move(chunk));
    });
}

void CallSession::on_turn_failed(uint64_t generation, std::string stage, std::string message) {
    post([generation, stage = std::move(stage), message = std::move(message)](CallSession& session) {
        session.handle_turn_failed(generation, stage, message);
    });
}

void CallSession::on_outbound_drained() {
    post([](CallSession& session) { session.handle_drained(); });
}

void CallSession::speak(std::string text) {
    post([text = std::move(text)](CallSession& session) { session.handle_speak(text); });
}

void CallSession::end() {
    if (!post([](CallSession& session) { session.handle_end(); })) {
        return;
    }
    queue_->stop();
}

ConversationHistory CallSession::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

void CallSession::handle_frame(const audio::AudioFrame& frame) {
    if (state() == CallState::Ended) {
        return;
    }
    auto event = segments_.push(frame);
    if (!event) {
        return;
    }
    switch (event->kind) {
        case SegmentEvent::Kind::SpeechStarted: {
            user_speaking_ = true;
            const auto current = state();
            if (current == CallState::Idle) {
                set_state(CallState::Listening);
            } else if (produces_output(current)) {
                if (config_.interruptions_are_allowed) {
                    barge_in();
                } else {
                    logging::debug("Speech during playback kept for next turn",
                                   {kv("call_id", id_)});
                }
            }
            break;
        }
        case SegmentEvent::Kind::SpeechContinuing:
            break;
        case SegmentEvent::Kind::UtteranceReady:
            user_speaking_ = false;
            pending_utterances_.push_back(std::move(*event->utterance));
            maybe_start_turn();
            break;
        case SegmentEvent::Kind::UtteranceDiscarded:
            user_speaking_ = false;
            Metrics::instance().increment("utterance_discarded");
            if (state() == CallState::Listening) {
                set_state(CallState::Idle);
            }
            break;
        case SegmentEvent::Kind::Timeout:
            Metrics::instance().increment("silence_timeout");
            logging::info("User silence timeout", {kv("call_id", id_)});
            if (callbacks_.on_silence_timeout) {
                callbacks_.on_silence_timeout(id_);
            }
            break;
    }
}

void CallSession::maybe_start_turn() {
    const auto current = state();
    if (current != CallState::Idle && current != CallState::Listening) {
        return;
    }
    if (pending_utterances_.empty()) {
        return;
    }
    auto utterance = std::move(pending_utterances_.front());
    pending_utterances_.pop_front();
    start_turn(std::move(utterance));
}

void CallSession::begin_turn() {
    turn_token_ = CancelToken{generation_.fetch_add(1) + 1};
    pending_fragment_.clear();
    response_complete_ = false;
    outbound_drained_ = false;
    chunks_delivered_ = 0;
    turn_started_ = std::chrono::steady_clock::now();
    stage_started_ = turn_started_;
    arm_deadline();
}

void CallSession::start_turn(audio::Utterance utterance) {
    begin_turn();
    set_state(CallState::Transcribing);
    record_utterance(utterance);
    logging::info("Transcribing utterance",
                  {kv("call_id", id_),
                   kv("generation", turn_token_.generation),
                   kv("duration_ms", utterance.duration_ms()),
                   kv("voiced_ms", utterance.voiced_ms)});

    std::weak_ptr<CallSession> weak = weak_from_this();
    auto transcriber = adapters_.transcriber;
    auto token = turn_token_;
    utils::run_async([weak, transcriber, token, utterance = std::move(utterance)]() {
        try {
            auto text = transcriber->transcribe(utterance, token);
            if (auto self = weak.lock()) {
                self->on_transcript_ready(token.generation, std::move(text));
            }
        } catch (const std::exception& ex) {
            if (auto self = weak.lock()) {
                self->on_turn_failed(token.generation, "transcribe", ex.what());
            }
        }
    }, "transcribe");
}

void CallSession::handle_transcript(uint64_t generation, const std::string& text) {
    if (!is_current(generation, "transcript") || state() != CallState::Transcribing) {
        return;
    }
    Metrics::instance().observe_stage_latency("transcribe", seconds_since(stage_started_));
    const auto cleaned = utils::trim(text);
    if (utils::is_blank_transcript(cleaned)) {
        logging::info("Empty transcript, turn skipped",
                      {kv("call_id", id_), kv("generation", generation)});
        fall_back_to_listening();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.append(Speaker::User, cleaned);
    }
    logging::info("User said",
                  {kv("call_id", id_), kv("generation", generation), kv("text", cleaned)});
    set_state(CallState::Generating);
    start_generation();
}

void CallSession::start_generation() {
    stage_started_ = std::chrono::steady_clock::now();
    std::weak_ptr<CallSession> weak = weak_from_this();
    auto responder = adapters_.responder;
    auto token = turn_token_;
    auto history = history_;
    const bool streaming = config_.stream_partial_responses;

    utils::run_async([weak, responder, token, history, streaming]() {
        try {
            if (!streaming) {
                auto text = responder->generate(history, token);
                if (auto self = weak.lock()) {
                    self->on_response_complete(token.generation, std::move(text));
                }
                return;
            }
            auto stream = responder->generate_stream(history, token);
            std::string full_text;
            while (auto fragment = stream->next()) {
                if (token.is_canceled()) {
                    stream->cancel();
                    return;
                }
                full_text += *fragment;
                auto self = weak.lock();
                if (!self) {
                    stream->cancel();
                    return;
                }
                self->on_response_fragment(token.generation, std::move(*fragment));
            }
            if (token.is_canceled()) {
                return;
            }
            if (auto self = weak.lock()) {
                self->on_response_complete(token.generation, std::move(full_text));
            }
        } catch (const std::exception& ex) {
            if (auto self = weak.lock()) {
                self->on_turn_failed(token.generation, "generate", ex.what());
            }
        }
    }, "generate");
}

void CallSession::handle_fragment(uint64_t generation, const std::string& fragment) {
    if (!is_current(generation, "response fragment") || !awaits_reply(state())) {
        return;
    }
    pending_fragment_ += fragment;
    if (utils::count_words(pending_fragment_) < static_cast<size_t>(config_.partial_tts_min_words)) {
        return;
    }
    // Cut at the last word boundary; the trailing word may still be growing.
    const auto cut = pending_fragment_.find_last_of(" \t\r\n");
    if (cut == std::string::npos) {
        return;
    }
    const auto ready = pending_fragment_.substr(0, cut);
    pending_fragment_.erase(0, cut + 1);
    enqueue_synthesis(ready);
}

void CallSession::handle_complete(uint64_t generation, const std::string& text) {
    if (!is_current(generation, "response") || !awaits_reply(state())) {
        return;
    }
    Metrics::instance().observe_stage_latency("generate", seconds_since(stage_started_));
    response_complete_ = true;
    const auto reply = utils::trim(text);
    if (utils::is_blank_transcript(utils::remove_emojis(reply))) {
        logging::warn("Response has nothing to synthesize, turn dropped",
                      {kv("call_id", id_), kv("generation", generation), kv("text", reply)});
        fall_back_to_listening();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.append(Speaker::Assistant, reply);
    }
    logging::info("Assistant replied",
                  {kv("call_id", id_), kv("generation", generation), kv("text", reply)});

    if (config_.stream_partial_responses) {
        flush_pending_fragment();
    } else {
        enqueue_synthesis(reply);
    }
    if (state() == CallState::Generating) {
        fall_back_to_listening();
        return;
    }
    maybe_finish_output();
}

void CallSession::enqueue_synthesis(const std::string& text) {
    const auto cleaned = utils::trim(utils::remove_emojis(text));
    if (utils::is_blank_transcript(cleaned)) {
        return;
    }
    if (state() == CallState::Generating) {
        stage_started_ = std::chrono::steady_clock::now();
        set_state(CallState::Synthesizing);
    }
    logging::debug("Synthesis queued",
                   {kv("call_id", id_),
                    kv("generation", turn_token_.generation),
                    kv("text", cleaned)});
    pipeline_->enqueue(cleaned, turn_token_);
}

void CallSession::flush_pending_fragment() {
    if (pending_fragment_.empty()) {
        return;
    }
    auto rest = std::move(pending_fragment_);
    pending_fragment_.clear();
    enqueue_synthesis(rest);
}

void CallSession::pump_synthesis() {
    if (state() == CallState::Ended) {
        return;
    }
    pipeline_->try_deliver();
    maybe_finish_output();
}

void CallSession::handle_chunk(audio::AudioChunk chunk) {
    if (!is_current(chunk.generation, "audio chunk") || !produces_output(state())) {
        return;
    }
    if (!outbound_->push(std::move(chunk))) {
        return;
    }
    ++chunks_delivered_;
    outbound_drained_ = false;
    if (state() == CallState::Synthesizing) {
        set_state(CallState::Speaking);
    }
    if (callbacks_.on_audio_available) {
        callbacks_.on_audio_available(id_);
    }
}

void CallSession::handle_drained() {
    outbound_drained_ = true;
    maybe_finish_output();
}

void CallSession::maybe_finish_output() {
    const auto current = state();
    if (!produces_output(current)) {
        return;
    }
    if (!response_complete_ || pipeline_->has_queue()) {
        return;
    }
    if (chunks_delivered_ == 0) {
        logging::warn("No audio synthesized for turn",
                      {kv("call_id", id_), kv("generation", turn_token_.generation)});
        fall_back_to_listening();
        return;
    }
    if (current == CallState::Speaking && outbound_drained_ && outbound_->empty()) {
        finish_turn();
    }
}

void CallSession::finish_turn() {
    Metrics::instance().observe_stage_latency("turn", seconds_since(turn_started_));
    turn_token_.cancel();
    set_state(user_speaking_ ? CallState::Listening : CallState::Idle);
    segments_.restart_silence_timer();
    maybe_start_turn();
}

void CallSession::cancel_turn() {
    turn_token_.cancel();
    pipeline_->cancel();
    const auto floor = generation_.fetch_add(1) + 1;
    const auto dropped = outbound_->discard(floor);
    const bool had_audio = chunks_delivered_ > 0;
    pending_fragment_.clear();
    response_complete_ = false;
    outbound_drained_ = false;
    chunks_delivered_ = 0;
    logging::debug("Turn canceled",
                   {kv("call_id", id_),
                    kv("generation", floor),
                    kv("dropped_chunks", dropped)});
    if (had_audio && callbacks_.on_playback_interrupted) {
        callbacks_.on_playback_interrupted(id_);
    }
}

void CallSession::fall_back_to_listening() {
    cancel_turn();
    set_state(CallState::Listening);
    maybe_start_turn();
}

void CallSession::barge_in() {
    Metrics::instance().increment("barge_in");
    logging::info("Caller interrupted playback",
                  {kv("call_id", id_), kv("generation", turn_token_.generation)});
    cancel_turn();
    set_state(CallState::Listening);
    maybe_start_turn();
}

void CallSession::handle_turn_failed(uint64_t generation, const std::string& stage,
                                     const std::string& message) {
    if (!is_current(generation, "failure")) {
        return;
    }
    const auto current = state();
    if (current == CallState::Idle || current == CallState::Listening ||
        current == CallState::Ended) {
        return;
    }
    Metrics::instance().increment(stage + "_failure");
    logging::error("Turn failed",
                   {kv("call_id", id_),
                    kv("generation", generation),
                    kv("stage", stage),
                    kv("error", message)});
    fall_back_to_listening();
}

void CallSession::arm_deadline() {
    if (config_.turn_deadline_sec <= 0.0) {
        return;
    }
    std::weak_ptr<CallSession> weak = weak_from_this();
    auto token = turn_token_;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(config_.turn_deadline_sec));
    utils::run_async([weak, token, deadline]() {
        while (std::chrono::steady_clock::now() < deadline) {
            if (token.is_canceled()) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (token.is_canceled()) {
            return;
        }
        if (auto self = weak.lock()) {
            const auto generation = token.generation;
            self->post([generation](CallSession& session) { session.handle_deadline(generation); });
        }
    }, "turn_deadline");
}

void CallSession::handle_deadline(uint64_t generation) {
    if (generation != generation_.load()) {
        return;
    }
    const auto current = state();
    if (current != CallState::Transcribing && current != CallState::Generating &&
        current != CallState::Synthesizing) {
        return;
    }
    Metrics::instance().increment("turn_deadline");
    logging::warn("Turn deadline exceeded",
                  {kv("call_id", id_),
                   kv("generation", generation),
                   kv("state", to_string(current))});
    fall_back_to_listening();
}

void CallSession::handle_speak(const std::string& text) {
    const auto current = state();
    if (current != CallState::Idle && current != CallState::Listening) {
        logging::warn("Cannot speak during an active turn",
                      {kv("call_id", id_), kv("state", to_string(current))});
        return;
    }
    const auto line = utils::trim(text);
    if (line.empty()) {
        return;
    }
    begin_turn();
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.append(Speaker::Assistant, line);
    }
    response_complete_ = true;
    set_state(CallState::Synthesizing);
    enqueue_synthesis(line);
    maybe_finish_output();
}

void CallSession::handle_end() {
    if (state() == CallState::Ended) {
        return;
    }
    cancel_turn();
    pending_utterances_.clear();
    outbound_->close();
    segments_.reset();
    set_state(CallState::Ended);
    logging::info("Call session ended",
                  {kv("call_id", id_),
                   kv("turns", history_.size()),
                   kv("dropped_frames", segments_.dropped_frames())});
}

void CallSession::record_utterance(const audio::Utterance& utterance) {
    if (!config_.record_utterances) {
        return;
    }
    ++utterance_counter_;
    const auto path = config_.utterance_audio_dir /
                      (id_ + "_" + std::to_string(utterance_counter_) + ".wav");
    if (!audio::write_wav_file(path, utterance.samples(), utterance.sample_rate)) {
        logging::warn("Failed to record utterance",
                      {kv("call_id", id_), kv("path", path.string())});
    }
}

bool CallSession::is_current(uint64_t generation, const char* what) const {
    const auto current = generation_.load();
    if (generation == current) {
        return true;
    }
    Metrics::instance().increment("stale_result");
    logging::debug("Dropping stale result",
                   {kv("call_id", id_),
                    kv("result", what),
                    kv("generation", generation),
                    kv("current", current)});
    return false;
}

void CallSession::set_state(CallState next) {
    const auto previous = state_.load();
    if (previous == next || previous == CallState::Ended) {
        return;
    }
    state_.store(next);
    logging::debug("Call state changed",
                   {kv("call_id", id_),
                    kv("from", to_string(previous)),
                    kv("to", to_string(next)),
                    kv("generation", generation_.load())});
    if (callbacks_.on_state_changed) {
        callbacks_.on_state_changed(id_, next);
    }
}

}
