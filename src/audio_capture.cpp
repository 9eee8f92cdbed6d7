#include "audio_capture.hpp"
#include <iostream>

namespace pushscribe {

AudioCapture::AudioCapture(int channels, int frames_per_buffer)
    : channels_(channels)
    , frames_per_buffer_(frames_per_buffer) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    stop_capture();
    Pa_Terminate();
    initialized_.store(false);
}

std::vector<AudioDevice> AudioCapture::enumerate_devices() {
    std::vector<AudioDevice> devices;
    if (!initialized_.load()) return devices;

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        std::cerr << "Failed to list devices: " << Pa_GetErrorText(count) << std::endl;
        return devices;
    }

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        AudioDevice device;
        device.id = i;
        device.name = info->name ? info->name : "";
        device.channels = info->maxInputChannels;
        devices.push_back(device);
    }
    return devices;
}

bool AudioCapture::start_capture(int device_id, int sample_rate) {
    if (!initialized_.load() || recording_.load()) return false;

    PaStreamParameters input_params;
    input_params.device = device_id >= 0 ? device_id : Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "No default input device" << std::endl;
        return false;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(input_params.device);
    if (!info || info->maxInputChannels < channels_) {
        std::cerr << "Input device " << input_params.device << " is not usable" << std::endl;
        return false;
    }

    input_params.channelCount = channels_;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        audio_buffer_.clear();
        audio_buffer_.reserve(static_cast<size_t>(sample_rate) * 30);  // 30 seconds
    }

    PaError err = Pa_OpenStream(&stream_,
                                &input_params,
                                nullptr,  // No output
                                sample_rate,
                                frames_per_buffer_,
                                paClipOff,
                                pa_callback,
                                this);
    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    recording_.store(true);

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        recording_.store(false);
        close_stream();
        return false;
    }

    return true;
}

std::vector<float> AudioCapture::stop_capture() {
    if (!recording_.load()) return {};

    recording_.store(false);

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }
    close_stream();

    std::lock_guard<std::mutex> lock(buffer_mutex_);
    std::vector<float> samples;
    samples.swap(audio_buffer_);
    return samples;
}

void AudioCapture::set_chunk_callback(ChunkCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void AudioCapture::close_stream() {
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!capture->recording_.load() || !input) return paContinue;

    const float* in = static_cast<const float*>(input);
    size_t count = frame_count * static_cast<size_t>(capture->channels_);

    {
        std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
        capture->audio_buffer_.insert(capture->audio_buffer_.end(), in, in + count);
    }

    std::lock_guard<std::mutex> lock(capture->callback_mutex_);
    if (capture->callback_) {
        std::vector<float> chunk(in, in + count);
        capture->callback_(chunk);
    }

    return paContinue;
}

} // namespace pushscribe
