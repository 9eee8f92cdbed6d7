#include "transcriber.hpp"
#include "audio_level.hpp"
#include "whisper.h"
#include <chrono>
#include <exception>
#include <iostream>

namespace pushscribe {

namespace {

constexpr int WHISPER_SAMPLE_RATE = 16000;

// Re-transcribe the utterance this often while streaming
constexpr auto STREAM_INTERVAL = std::chrono::milliseconds(300);

// Minimum audio before the first partial hypothesis
constexpr size_t STREAM_MIN_SAMPLES = WHISPER_SAMPLE_RATE / 2;

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    stop_streaming();
    shutdown();
}

bool Transcriber::initialize(const std::string& model_path, int n_threads) {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) return true;

    n_threads_ = n_threads;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "Failed to load whisper model: " << model_path << std::endl;
        return false;
    }

    std::cout << "Loaded whisper model: " << model_path << std::endl;
    return true;
}

void Transcriber::shutdown() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

TranscriptionResult Transcriber::transcribe(const std::vector<float>& samples, int sample_rate) {
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        TranscriptionResult result;
        result.error = "Unsupported sample rate " + std::to_string(sample_rate) + " (need 16000)";
        return result;
    }
    return run_whisper(samples, profile_);
}

TranscriptionResult Transcriber::run_whisper(std::vector<float> audio, const TranscriptionProfile& profile) {
    TranscriptionResult result;

    if (audio.empty()) {
        result.error = "No audio data";
        return result;
    }

    if (preprocess_) {
        audio = trim_silence(audio, 0.01f, WHISPER_SAMPLE_RATE / 20, WHISPER_SAMPLE_RATE);
        normalize_peak(audio);
    }

    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (!ctx_) {
        result.error = "Transcriber not initialized";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(
        profile.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY
    );

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = initial_prompt_.empty();
    wparams.language         = language_.c_str();  // "auto" detects
    wparams.n_threads        = n_threads_;

    wparams.greedy.best_of        = profile.best_of;
    wparams.beam_search.beam_size = profile.beam_size;
    wparams.entropy_thold         = profile.entropy_thold;
    wparams.no_speech_thold       = profile.no_speech_thold;
    wparams.temperature           = profile.temperature;
    wparams.logprob_thold         = -1.0f;

    if (!initial_prompt_.empty()) {
        wparams.initial_prompt = initial_prompt_.c_str();
    }

    int ret = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        result.error = "Whisper inference failed";
        return result;
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    const char* lang = whisper_lang_str(whisper_full_lang_id(ctx_));

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    result.text = trim(text);
    result.language = lang ? lang : "";
    result.duration_ms = duration.count();
    result.success = true;

    std::cout << "Transcription [" << profile.name << ", " << result.language << "] took "
              << result.duration_ms << "ms: \"" << result.text << "\"" << std::endl;

    return result;
}

bool Transcriber::start_streaming(PartialCallback on_partial) {
    if (!is_initialized() || streaming_.load()) return false;

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_buffer_.clear();
        stop_requested_ = false;
        on_partial_ = std::move(on_partial);
    }

    streaming_.store(true);
    stream_thread_ = std::thread(&Transcriber::stream_loop, this);
    return true;
}

void Transcriber::push_audio(const std::vector<float>& chunk) {
    if (!streaming_.load()) return;

    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_buffer_.insert(stream_buffer_.end(), chunk.begin(), chunk.end());
}

std::string Transcriber::stop_streaming() {
    if (!streaming_.exchange(false)) return "";

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stop_requested_ = true;
    }
    stream_cv_.notify_all();

    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }

    std::vector<float> audio;
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        audio.swap(stream_buffer_);
        on_partial_ = nullptr;
    }

    if (audio.empty()) return "";

    TranscriptionResult result = run_whisper(audio, profile_);
    if (!result.success) {
        std::cerr << "Final streaming transcription failed: " << result.error << std::endl;
        return "";
    }
    return result.text;
}

void Transcriber::stream_loop() {
    size_t last_size = 0;
    std::string last_text;

    while (true) {
        std::vector<float> audio;
        PartialCallback on_partial;
        {
            std::unique_lock<std::mutex> lock(stream_mutex_);
            stream_cv_.wait_for(lock, STREAM_INTERVAL, [this] { return stop_requested_; });
            if (stop_requested_) break;

            if (stream_buffer_.size() < STREAM_MIN_SAMPLES || stream_buffer_.size() == last_size) {
                continue;
            }
            audio = stream_buffer_;
            on_partial = on_partial_;
        }
        last_size = audio.size();

        // Partials favour latency over accuracy
        TranscriptionResult result = run_whisper(audio, PROFILE_FAST);
        if (!result.success || result.text.empty() || result.text == last_text) continue;

        last_text = result.text;
        if (on_partial) {
            try {
                on_partial(result.text);
            } catch (const std::exception& e) {
                std::cerr << "Partial transcript handler failed: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "Partial transcript handler failed: unknown exception" << std::endl;
            }
        }
    }
}

} // namespace pushscribe
