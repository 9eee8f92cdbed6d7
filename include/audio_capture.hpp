#pragma once

#include "interfaces.hpp"

#include <atomic>
#include <mutex>
#include <vector>
#include <portaudio.h>

namespace pushscribe {

// PortAudio microphone. A stream is opened per capture so the device and
// sample rate can change between sessions.
class AudioCapture : public AudioSource {
public:
    explicit AudioCapture(int channels = 1, int frames_per_buffer = 512);
    ~AudioCapture() override;

    bool initialize();
    void shutdown();

    bool start_capture(int device_id, int sample_rate) override;
    std::vector<float> stop_capture() override;
    std::vector<AudioDevice> enumerate_devices() override;
    void set_chunk_callback(ChunkCallback callback) override;

    bool is_recording() const { return recording_.load(); }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    void close_stream();

    int channels_;
    int frames_per_buffer_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};

    std::vector<float> audio_buffer_;
    std::mutex buffer_mutex_;

    // Guards callback_ against the audio thread
    std::mutex callback_mutex_;
    ChunkCallback callback_;
};

} // namespace pushscribe
