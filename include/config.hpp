#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pushscribe {

// Quality modes for accuracy/speed tradeoff
enum class ModelQuality {
    Fast,       // tiny - fastest
    Balanced,   // base - good balance
    Accurate,   // small - high accuracy
    Best        // medium - highest accuracy, slow
};

// Transcription parameter profiles
struct TranscriptionProfile {
    int best_of;
    int beam_size;
    float entropy_thold;
    float no_speech_thold;
    float temperature;
    const char* name;
};

// best_of: number of candidates, beam_size: beam search width
// entropy_thold: skip if entropy > threshold, no_speech_thold: skip if no_speech prob > threshold
inline const TranscriptionProfile PROFILE_FAST = {1, 1, 2.4f, 0.6f, 0.0f, "Fast"};
inline const TranscriptionProfile PROFILE_BALANCED = {5, 5, 2.8f, 0.5f, 0.0f, "Balanced"};
inline const TranscriptionProfile PROFILE_ACCURATE = {5, 8, 3.0f, 0.4f, 0.0f, "Accurate"};
inline const TranscriptionProfile PROFILE_BEST = {5, 10, 3.0f, 0.35f, 0.0f, "Best"};

inline const TranscriptionProfile& get_profile(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return PROFILE_FAST;
        case ModelQuality::Balanced: return PROFILE_BALANCED;
        case ModelQuality::Accurate: return PROFILE_ACCURATE;
        case ModelQuality::Best: return PROFILE_BEST;
        default: return PROFILE_BALANCED;
    }
}

// Multilingual models: dictation is not English-only
inline std::string get_model_filename(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return "ggml-tiny.bin";
        case ModelQuality::Balanced: return "ggml-base.bin";
        case ModelQuality::Accurate: return "ggml-small.bin";
        case ModelQuality::Best: return "ggml-medium.bin";
        default: return "ggml-base.bin";
    }
}

inline const char* model_quality_name(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return "fast";
        case ModelQuality::Balanced: return "balanced";
        case ModelQuality::Accurate: return "accurate";
        case ModelQuality::Best: return "best";
    }
    return "balanced";
}

// Accepts the names above; returns false for anything else
inline bool parse_model_quality(const std::string& name, ModelQuality& out) {
    if (name == "fast") out = ModelQuality::Fast;
    else if (name == "balanced") out = ModelQuality::Balanced;
    else if (name == "accurate") out = ModelQuality::Accurate;
    else if (name == "best") out = ModelQuality::Best;
    else return false;
    return true;
}

enum class ActionKind {
    Dictate,
    Translate,
    Fix,
    Custom
};

inline const char* action_kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Dictate: return "dictate";
        case ActionKind::Translate: return "translate";
        case ActionKind::Fix: return "fix";
        case ActionKind::Custom: return "custom";
    }
    return "custom";
}

// One hotkey-triggered action. `instruction` is the transform prompt; an
// empty one means the per-kind default (Dictate never transforms).
struct ActionConfig {
    ActionKind kind = ActionKind::Dictate;
    std::string id;
    std::string name;
    std::string hotkey;
    std::string instruction;
};

inline const char* DEFAULT_TRANSLATE_PROMPT =
    "Translate this text into English. Fix any mistakes and use simple words. "
    "Return ONLY the translation, without explanations.";

inline const char* DEFAULT_FIX_PROMPT =
    "Fix grammar, spelling and punctuation in this text while keeping its language "
    "and meaning. Return ONLY the corrected text, without explanations.";

inline std::string default_instruction(ActionKind kind) {
    switch (kind) {
        case ActionKind::Translate: return DEFAULT_TRANSLATE_PROMPT;
        case ActionKind::Fix: return DEFAULT_FIX_PROMPT;
        default: return "";
    }
}

struct CustomAction {
    std::string id;
    std::string name;
    std::string hotkey;
    std::string prompt;
};

struct Config {
    // Audio settings
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;    // Low latency buffer
    int device_id = -1;             // -1: default input device

    // Whisper model
    std::string model_dir = "models";
    ModelQuality model_quality = ModelQuality::Balanced;
    int n_threads = 4;              // CPU threads for inference
    std::string language = "auto";

    // Vocabulary hint passed to whisper; empty disables it
    std::string initial_prompt;

    // Trim silence and normalize level before inference
    bool audio_preprocessing = true;

    std::string get_model_path() const {
        return model_dir + "/" + get_model_filename(model_quality);
    }

    // Behavior
    bool streaming = false;         // Type partial hypotheses while speaking
    bool filter_fillers = true;
    size_t history_size = 20;
    float quiet_threshold_db = -50.0f;  // Below this the recording is treated as silence

    // Text transform (translate / fix / custom actions)
    std::string openai_api_key;
    std::string transform_model = "gpt-4o-mini";

    // Hotkeys
    std::string dictate_hotkey = "<cmd>+<shift>+d";
    std::string translate_hotkey = "<cmd>+<shift>+t";
    std::string fix_hotkey = "<cmd>+<shift>+f";
    std::string translation_prompt = DEFAULT_TRANSLATE_PROMPT;
    std::string fix_prompt = DEFAULT_FIX_PROMPT;
    std::vector<CustomAction> custom_actions;

    // Ordered action list consumed by the session arbiter. Actions with an
    // empty hotkey are left out.
    std::vector<ActionConfig> actions() const {
        std::vector<ActionConfig> out;
        if (!dictate_hotkey.empty()) {
            out.push_back({ActionKind::Dictate, "dictate", "Dictate", dictate_hotkey, ""});
        }
        if (!translate_hotkey.empty()) {
            out.push_back({ActionKind::Translate, "translate", "Translate", translate_hotkey, translation_prompt});
        }
        if (!fix_hotkey.empty()) {
            out.push_back({ActionKind::Fix, "fix", "Smart fix", fix_hotkey, fix_prompt});
        }
        for (const auto& custom : custom_actions) {
            if (custom.hotkey.empty()) continue;
            out.push_back({ActionKind::Custom, "custom:" + custom.id, custom.name, custom.hotkey, custom.prompt});
        }
        return out;
    }
};

} // namespace pushscribe
