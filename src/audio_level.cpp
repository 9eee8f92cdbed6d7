#include "audio_level.hpp"
#include <algorithm>
#include <cmath>

namespace pushscribe {

namespace {

float window_rms(const std::vector<float>& audio, size_t begin, size_t end) {
    float sum_sq = 0.0f;
    for (size_t j = begin; j < end; ++j) {
        sum_sq += audio[j] * audio[j];
    }
    return std::sqrt(sum_sq / static_cast<float>(end - begin));
}

} // namespace

float audio_rms(const std::vector<float>& audio) {
    if (audio.empty()) return 0.0f;
    return window_rms(audio, 0, audio.size());
}

float audio_peak(const std::vector<float>& audio) {
    float peak = 0.0f;
    for (float sample : audio) {
        peak = std::max(peak, std::abs(sample));
    }
    return peak;
}

float audio_level_db(const std::vector<float>& audio) {
    float rms = audio_rms(audio);
    if (rms <= 0.0f) return SILENCE_DB;
    return std::max(SILENCE_DB, 20.0f * std::log10(rms));
}

void normalize_peak(std::vector<float>& audio, float target_peak) {
    if (audio.empty()) return;

    float peak = audio_peak(audio);

    // Don't amplify very quiet signals
    if (peak < 0.001f) return;  // -60dB

    float gain = std::min(target_peak / peak, 10.0f);

    for (float& sample : audio) {
        sample = std::max(-1.0f, std::min(1.0f, sample * gain));
    }
}

std::vector<float> trim_silence(const std::vector<float>& audio,
                                float threshold,
                                int padding_samples,
                                int sample_rate) {
    size_t window = static_cast<size_t>(std::max(1, sample_rate / 100));  // 10ms
    if (audio.size() < window) return audio;

    size_t hop = std::max<size_t>(1, window / 2);
    size_t padding = static_cast<size_t>(std::max(0, padding_samples));

    // First window above threshold
    size_t start_idx = audio.size();
    for (size_t i = 0; i + window <= audio.size(); i += hop) {
        if (window_rms(audio, i, i + window) > threshold) {
            start_idx = i > padding ? i - padding : 0;
            break;
        }
    }
    if (start_idx == audio.size()) return audio;  // no speech found

    // Last window above threshold
    size_t end_idx = audio.size();
    for (size_t i = audio.size(); i >= window; i -= hop) {
        if (window_rms(audio, i - window, i) > threshold) {
            end_idx = std::min(i + padding, audio.size());
            break;
        }
        if (i < window + hop) break;
    }

    if (start_idx >= end_idx || end_idx - start_idx < static_cast<size_t>(sample_rate / 10)) {
        return audio;
    }

    return std::vector<float>(audio.begin() + static_cast<std::ptrdiff_t>(start_idx),
                              audio.begin() + static_cast<std::ptrdiff_t>(end_idx));
}

} // namespace pushscribe
