// Automated tests for audio level helpers

#include "audio_level.hpp"
#include <iostream>
#include <cmath>
#include <cassert>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace pushscribe;

// Generate test signals
std::vector<float> generate_sine(int samples, float freq, float amplitude, int sample_rate = 16000) {
    std::vector<float> audio(samples);
    for (int i = 0; i < samples; ++i) {
        audio[i] = amplitude * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / sample_rate);
    }
    return audio;
}

std::vector<float> generate_silence(int samples) {
    return std::vector<float>(samples, 0.0f);
}

void test_levels() {
    std::cout << "Testing RMS, peak and dBFS..." << std::endl;

    auto constant = std::vector<float>(1000, 0.5f);
    assert(std::abs(audio_rms(constant) - 0.5f) < 1e-4f);
    assert(std::abs(audio_peak(constant) - 0.5f) < 1e-6f);
    assert(std::abs(audio_level_db(constant) - (-6.02f)) < 0.05f);

    auto sine = generate_sine(16000, 440.0f, 1.0f);
    assert(std::abs(audio_rms(sine) - 0.7071f) < 0.01f);
    assert(std::abs(audio_level_db(sine) - (-3.01f)) < 0.1f);

    std::cout << "  Sine level: " << audio_level_db(sine) << " dBFS" << std::endl;
    std::cout << "  PASS" << std::endl;
}

void test_silence() {
    std::cout << "Testing silence and empty buffers..." << std::endl;

    assert(audio_level_db(generate_silence(16000)) == SILENCE_DB);
    assert(audio_level_db(std::vector<float>()) == SILENCE_DB);
    assert(audio_rms(std::vector<float>()) == 0.0f);
    assert(audio_peak(std::vector<float>()) == 0.0f);

    // Tiny but nonzero stays above the floor
    auto whisper = std::vector<float>(1000, 1e-4f);
    assert(audio_level_db(whisper) > SILENCE_DB);
    assert(audio_level_db(whisper) < -50.0f);

    std::cout << "  PASS" << std::endl;
}

void test_normalize() {
    std::cout << "Testing peak normalization..." << std::endl;

    auto quiet = generate_sine(16000, 440.0f, 0.3f);
    normalize_peak(quiet);
    assert(std::abs(audio_peak(quiet) - 0.9f) < 0.01f);

    // Gain is capped at 10x
    auto faint = generate_sine(16000, 440.0f, 0.01f);
    normalize_peak(faint);
    assert(std::abs(audio_peak(faint) - 0.1f) < 0.005f);

    // Below -60 dB nothing happens
    auto noise_floor = std::vector<float>(100, 0.0005f);
    normalize_peak(noise_floor);
    assert(noise_floor[0] == 0.0005f);

    std::vector<float> empty;
    normalize_peak(empty);
    assert(empty.empty());

    std::cout << "  PASS" << std::endl;
}

void test_trim_silence() {
    std::cout << "Testing silence trimming..." << std::endl;

    // 0.5s silence + 1s tone + 0.5s silence
    std::vector<float> audio = generate_silence(8000);
    auto tone = generate_sine(16000, 440.0f, 0.5f);
    audio.insert(audio.end(), tone.begin(), tone.end());
    auto tail = generate_silence(8000);
    audio.insert(audio.end(), tail.begin(), tail.end());

    auto trimmed = trim_silence(audio, 0.01f, 1600, 16000);
    std::cout << "  " << audio.size() << " -> " << trimmed.size() << " samples" << std::endl;
    assert(trimmed.size() < audio.size());
    assert(trimmed.size() >= 16000);
    assert(trimmed.size() <= 16000 + 2 * 1600 + 2 * 160);

    // All silence: returned unchanged
    auto silent = generate_silence(16000);
    assert(trim_silence(silent, 0.01f, 1600, 16000).size() == silent.size());

    // A click shorter than 100ms: returned unchanged
    std::vector<float> click = generate_silence(16000);
    for (int i = 8000; i < 8100; ++i) click[i] = 0.5f;
    assert(trim_silence(click, 0.01f, 0, 16000).size() == click.size());

    // Shorter than one window
    std::vector<float> tiny(50, 0.5f);
    assert(trim_silence(tiny, 0.01f, 0, 16000).size() == 50);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Audio Level Test Suite ===" << std::endl << std::endl;

    test_levels();
    test_silence();
    test_normalize();
    test_trim_silence();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
