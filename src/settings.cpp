#include "settings.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace pushscribe {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

template <typename T>
void read_if_present(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

std::string default_settings_path() {
    fs::path base;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        base = xdg;
    } else {
        const char* home = std::getenv("HOME");
        base = fs::path(home ? home : ".") / ".config";
    }
    return (base / "pushscribe" / "settings.json").string();
}

bool parse_settings(const std::string& json_text, Config& config, std::string& error) {
    Config parsed = config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            error = "settings must be a JSON object";
            return false;
        }

        read_if_present(j, "hotkey", parsed.dictate_hotkey);
        read_if_present(j, "translate_hotkey", parsed.translate_hotkey);
        read_if_present(j, "fix_hotkey", parsed.fix_hotkey);
        read_if_present(j, "language", parsed.language);
        read_if_present(j, "filter_fillers", parsed.filter_fillers);

        auto history_size = j.find("history_size");
        if (history_size != j.end() && !history_size->is_null()) {
            if (history_size->is_number_integer() && history_size->get<long long>() < 0) {
                error = "history_size must not be negative";
                return false;
            }
            parsed.history_size = history_size->get<size_t>();
        }
        read_if_present(j, "streaming", parsed.streaming);
        read_if_present(j, "openai_api_key", parsed.openai_api_key);
        read_if_present(j, "transform_model", parsed.transform_model);
        read_if_present(j, "translation_prompt", parsed.translation_prompt);
        read_if_present(j, "fix_prompt", parsed.fix_prompt);
        read_if_present(j, "model_dir", parsed.model_dir);
        read_if_present(j, "threads", parsed.n_threads);
        read_if_present(j, "initial_prompt", parsed.initial_prompt);
        read_if_present(j, "audio_preprocessing", parsed.audio_preprocessing);
        read_if_present(j, "quiet_threshold_db", parsed.quiet_threshold_db);

        // null selects the default microphone
        auto mic = j.find("microphone_id");
        if (mic != j.end()) {
            parsed.device_id = mic->is_null() ? -1 : mic->get<int>();
        }

        auto quality = j.find("model_quality");
        if (quality != j.end() && !quality->is_null()) {
            std::string name = quality->get<std::string>();
            if (!parse_model_quality(name, parsed.model_quality)) {
                error = "unknown model_quality '" + name + "'";
                return false;
            }
        }

        auto custom = j.find("custom_actions");
        if (custom != j.end() && custom->is_array()) {
            parsed.custom_actions.clear();
            for (const auto& item : *custom) {
                CustomAction action;
                read_if_present(item, "id", action.id);
                read_if_present(item, "name", action.name);
                read_if_present(item, "hotkey", action.hotkey);
                read_if_present(item, "prompt", action.prompt);
                if (action.id.empty()) {
                    std::cerr << "Ignoring custom action without id" << std::endl;
                    continue;
                }
                if (action.name.empty()) action.name = action.id;
                parsed.custom_actions.push_back(action);
            }
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    config = parsed;
    return true;
}

std::string serialize_settings(const Config& config) {
    json j;
    j["hotkey"] = config.dictate_hotkey;
    j["translate_hotkey"] = config.translate_hotkey;
    j["fix_hotkey"] = config.fix_hotkey;
    j["microphone_id"] = config.device_id < 0 ? json(nullptr) : json(config.device_id);
    j["language"] = config.language;
    j["filter_fillers"] = config.filter_fillers;
    j["history_size"] = config.history_size;
    j["streaming"] = config.streaming;
    j["openai_api_key"] = config.openai_api_key;
    j["transform_model"] = config.transform_model;
    j["translation_prompt"] = config.translation_prompt;
    j["fix_prompt"] = config.fix_prompt;
    j["model_dir"] = config.model_dir;
    j["model_quality"] = model_quality_name(config.model_quality);
    j["threads"] = config.n_threads;
    j["initial_prompt"] = config.initial_prompt;
    j["audio_preprocessing"] = config.audio_preprocessing;
    j["quiet_threshold_db"] = config.quiet_threshold_db;

    json custom = json::array();
    for (const auto& action : config.custom_actions) {
        custom.push_back({
            {"id", action.id},
            {"name", action.name},
            {"hotkey", action.hotkey},
            {"prompt", action.prompt},
        });
    }
    j["custom_actions"] = custom;

    return j.dump(4);
}

bool load_settings(const std::string& path, Config& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    if (!parse_settings(buffer.str(), config, error)) {
        std::cerr << "Failed to load settings from " << path << ": " << error << std::endl;
        return false;
    }

    std::cout << "Settings loaded from " << path << std::endl;
    return true;
}

bool save_settings(const std::string& path, const Config& config) {
    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Failed to create settings directory: " << e.what() << std::endl;
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to write settings to " << path << std::endl;
        return false;
    }

    file << serialize_settings(config) << std::endl;
    return file.good();
}

void apply_environment(Config& config) {
    if (!config.openai_api_key.empty()) return;

    const char* key = std::getenv("OPENAI_API_KEY");
    if (key && *key) {
        config.openai_api_key = key;
    }
}

} // namespace pushscribe
