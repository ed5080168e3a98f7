#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voice_bridge/adapters/adapters.hpp"
#include "voice_bridge/audio/codec.hpp"
#include "voice_bridge/session/history.hpp"
#include "voice_bridge/session/outbound_queue.hpp"
#include "voice_bridge/session/segment_buffer.hpp"
#include "voice_bridge/session/synthesis_pipeline.hpp"
#include "voice_bridge/utils/task_queue.hpp"

namespace voice_bridge {

struct Config;

enum class CallState {
    Idle,
    Listening,
    Transcribing,
    Generating,
    Synthesizing,
    Speaking,
    Ended
};

const char* to_string(CallState state);

struct SessionConfig {
    SegmentConfig segment;
    audio::Encoding encoding = audio::Encoding::Mulaw;
    int sample_rate = 8000;
    bool interruptions_are_allowed = true;
    bool stream_partial_responses = true;
    int partial_tts_min_words = 5;
    // Zero disables the per-turn deadline.
    double turn_deadline_sec = 30.0;
    int tts_max_inflight = 2;
    bool record_utterances = false;
    std::filesystem::path utterance_audio_dir;

    static SessionConfig from_config(const Config& config);
};

struct SessionAdapters {
    std::shared_ptr<TranscriptionAdapter> transcriber;
    std::shared_ptr<ResponseAdapter> responder;
    std::shared_ptr<SynthesisAdapter> synthesizer;
};

struct SessionCallbacks {
    std::function<void(const std::string& call_id)> on_audio_available;
    std::function<void(const std::string& call_id)> on_playback_interrupted;
    std::function<void(const std::string& call_id)> on_silence_timeout;
    std::function<void(const std::string& call_id, CallState state)> on_state_changed;
};

class CallSession : public std::enable_shared_from_this<CallSession> {
public:
    static std::shared_ptr<CallSession> create(std::string id,
                                               SessionConfig config,
                                               SessionAdapters adapters,
                                               std::unique_ptr<vad::VoiceActivityDetector> detector,
                                               SessionCallbacks callbacks = {});
    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    bool on_media_payload(const std::string& payload_b64, uint64_t sequence);
    bool on_audio_frame(audio::AudioFrame frame);

    void on_transcript_ready(uint64_t generation, std::string text);
    void on_response_fragment(uint64_t generation, std::string fragment);
    void on_response_complete(uint64_t generation, std::string text);
    void on_audio_chunk_ready(audio::AudioChunk chunk);
    void on_turn_failed(uint64_t generation, std::string stage, std::string message);
    void on_outbound_drained();

    // Plays an assistant line outside of a user turn, e.g. a greeting.
    void speak(std::string text);

    void end();

    const std::string& id() const { return id_; }
    CallState state() const { return state_.load(); }
    uint64_t generation() const { return generation_.load(); }
    ConversationHistory history() const;
    const std::shared_ptr<OutboundAudioQueue>& outbound() const { return outbound_; }

private:
    CallSession(std::string id,
                SessionConfig config,
                SessionAdapters adapters,
                std::unique_ptr<vad::VoiceActivityDetector> detector,
                SessionCallbacks callbacks);

    bool post(std::function<void(CallSession&)> handler);

    void handle_frame(const audio::AudioFrame& frame);
    void handle_transcript(uint64_t generation, const std::string& text);
    void handle_fragment(uint64_t generation, const std::string& fragment);
    void handle_complete(uint64_t generation, const std::string& text);
    void handle_chunk(audio::AudioChunk chunk);
    void handle_turn_failed(uint64_t generation, const std::string& stage,
                            const std::string& message);
    void handle_drained();
    void handle_speak(const std::string& text);
    void handle_deadline(uint64_t generation);
    void handle_end();

    void maybe_start_turn();
    void start_turn(audio::Utterance utterance);
    void begin_turn();
    void start_generation();
    void enqueue_synthesis(const std::string& text);
    void flush_pending_fragment();
    void pump_synthesis();
    void maybe_finish_output();
    void finish_turn();
    void cancel_turn();
    void fall_back_to_listening();
    void barge_in();
    void arm_deadline();
    void record_utterance(const audio::Utterance& utterance);
    bool is_current(uint64_t generation, const char* what) const;
    void set_state(CallState next);

    std::string id_;
    SessionConfig config_;
    SessionAdapters adapters_;
    SessionCallbacks callbacks_;
    audio::AudioFrameDecoder decoder_;
    SegmentBuffer segments_;

    std::unique_ptr<utils::TaskQueue> queue_;
    std::shared_ptr<SynthesisPipeline> pipeline_;
    std::shared_ptr<OutboundAudioQueue> outbound_;

    mutable std::mutex history_mutex_;
    ConversationHistory history_;

    std::atomic<CallState> state_{CallState::Idle};
    std::atomic<uint64_t> generation_{0};

    // Touched only on the session worker.
    CancelToken turn_token_;
    std::deque<audio::Utterance> pending_utterances_;
    std::string pending_fragment_;
    bool response_complete_ = false;
    bool outbound_drained_ = false;
    bool user_speaking_ = false;
    size_t chunks_delivered_ = 0;
    uint64_t utterance_counter_ = 0;
    std::chrono::steady_clock::time_point turn_started_;
    std::chrono::steady_clock::time_point stage_started_;
};

}
