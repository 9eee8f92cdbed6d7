#pragma once

#include "config.hpp"
#include "interfaces.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declare whisper types
struct whisper_context;

namespace pushscribe {

// whisper.cpp speech recognition. Batch transcription plus a streaming mode
// that re-transcribes the growing utterance every 300 ms and reports each
// changed hypothesis.
class Transcriber : public SpeechTranscriber {
public:
    Transcriber();
    ~Transcriber() override;

    // Initialize with model path
    bool initialize(const std::string& model_path, int n_threads = 4);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    // 16kHz mono float only
    TranscriptionResult transcribe(const std::vector<float>& samples, int sample_rate) override;

    bool supports_streaming() const override { return is_initialized(); }
    bool start_streaming(PartialCallback on_partial) override;
    void push_audio(const std::vector<float>& chunk) override;
    std::string stop_streaming() override;

    // Settings
    void set_language(const std::string& lang) { language_ = lang; }
    void set_profile(const TranscriptionProfile& profile) { profile_ = profile; }
    void set_initial_prompt(const std::string& prompt) { initial_prompt_ = prompt; }
    void set_preprocessing(bool enabled) { preprocess_ = enabled; }

private:
    TranscriptionResult run_whisper(std::vector<float> audio, const TranscriptionProfile& profile);
    void stream_loop();

    // Serializes every use of ctx_
    std::mutex ctx_mutex_;
    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    std::string language_ = "auto";
    TranscriptionProfile profile_ = PROFILE_BALANCED;
    std::string initial_prompt_;
    bool preprocess_ = true;

    // Streaming state
    std::thread stream_thread_;
    std::atomic<bool> streaming_{false};
    std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool stop_requested_ = false;
    std::vector<float> stream_buffer_;
    PartialCallback on_partial_;
};

} // namespace pushscribe
