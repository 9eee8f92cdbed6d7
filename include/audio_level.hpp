#pragma once

#include <vector>

namespace pushscribe {

// Level of silence (and of an empty buffer) in dBFS
constexpr float SILENCE_DB = -120.0f;

float audio_rms(const std::vector<float>& audio);
float audio_peak(const std::vector<float>& audio);

// RMS level relative to full scale, clamped at SILENCE_DB
float audio_level_db(const std::vector<float>& audio);

// Scale so the peak reaches `target_peak`. Gain is capped at 10x (+20 dB)
// and signals below -60 dB are left alone.
void normalize_peak(std::vector<float>& audio, float target_peak = 0.9f);

// Cut leading and trailing silence using 10 ms RMS windows. Keeps
// `padding_samples` on each side of the detected speech and returns the
// input unchanged when less than 100 ms would remain.
std::vector<float> trim_silence(const std::vector<float>& audio,
                                float threshold,
                                int padding_samples,
                                int sample_rate);

} // namespace pushscribe
