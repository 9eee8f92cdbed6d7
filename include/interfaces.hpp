#pragma once

#include "history.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pushscribe {

enum class AppState {
    Idle,
    Recording,
    Processing
};

inline const char* app_state_name(AppState state) {
    switch (state) {
        case AppState::Idle: return "idle";
        case AppState::Recording: return "recording";
        case AppState::Processing: return "processing";
    }
    return "unknown";
}

struct AudioDevice {
    int id = -1;
    std::string name;
    int channels = 0;
};

// Microphone. The hotkey engine only starts and stops it; device selection
// comes from configuration.
class AudioSource {
public:
    using ChunkCallback = std::function<void(const std::vector<float>&)>;

    virtual ~AudioSource() = default;

    // device_id -1 selects the default input device
    virtual bool start_capture(int device_id, int sample_rate) = 0;

    // Stops capturing and returns every sample since start_capture()
    virtual std::vector<float> stop_capture() = 0;

    virtual std::vector<AudioDevice> enumerate_devices() = 0;

    // Receives each chunk as it arrives, on the audio thread. Pass an empty
    // function to clear.
    virtual void set_chunk_callback(ChunkCallback callback) = 0;
};

struct TranscriptionResult {
    std::string text;
    std::string language;
    int64_t duration_ms = 0;
    bool success = false;
    std::string error;
};

class SpeechTranscriber {
public:
    using PartialCallback = std::function<void(const std::string&)>;

    virtual ~SpeechTranscriber() = default;

    // Samples are mono float in [-1, 1]
    virtual TranscriptionResult transcribe(const std::vector<float>& samples, int sample_rate) = 0;

    virtual bool supports_streaming() const { return false; }

    // Begin a streaming utterance. `on_partial` gets the whole current
    // hypothesis each time it changes, from the transcriber's own thread.
    virtual bool start_streaming(PartialCallback on_partial) {
        (void)on_partial;
        return false;
    }

    virtual void push_audio(const std::vector<float>& chunk) { (void)chunk; }

    // Finishes the utterance and returns the final text
    virtual std::string stop_streaming() { return ""; }
};

struct TransformResult {
    std::string text;
    bool success = false;
    bool api_key_missing = false;
    std::string error;
};

// Rewrites text according to an instruction prompt (translate, fix, custom)
class TextTransformer {
public:
    virtual ~TextTransformer() = default;
    virtual TransformResult transform(const std::string& text, const std::string& instruction) = 0;
};

// Puts text at the cursor of the focused application. Best effort.
class TextInserter {
public:
    virtual ~TextInserter() = default;
    virtual bool insert(const std::string& text) = 0;
    virtual bool delete_backward(size_t count) = 0;
};

class StatusListener {
public:
    virtual ~StatusListener() = default;
    virtual void on_status(AppState state, const std::string& message) = 0;
    virtual void on_alert(const std::string& title, const std::string& message) = 0;
    virtual void on_history_changed(const std::vector<HistoryEntry>& recent) = 0;
};

} // namespace pushscribe
