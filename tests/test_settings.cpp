// Automated tests for the JSON settings file

#include "settings.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace pushscribe;

void test_defaults_untouched() {
    std::cout << "Testing empty document keeps defaults..." << std::endl;

    Config config;
    std::string error;
    assert(parse_settings("{}", config, error));
    assert(config.dictate_hotkey == "<cmd>+<shift>+d");
    assert(config.translate_hotkey == "<cmd>+<shift>+t");
    assert(config.language == "auto");
    assert(config.filter_fillers);
    assert(config.history_size == 20);
    assert(config.device_id == -1);
    assert(config.initial_prompt.empty());
    assert(config.audio_preprocessing);
    assert(config.actions().size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_parse_fields() {
    std::cout << "Testing known keys..." << std::endl;

    const char* text = R"({
        "hotkey": "<ctrl>+<alt>+space",
        "translate_hotkey": "",
        "language": "ru",
        "filter_fillers": false,
        "history_size": 5,
        "streaming": true,
        "microphone_id": 3,
        "model_quality": "fast",
        "threads": 8,
        "quiet_threshold_db": -40.5,
        "openai_api_key": "sk-test",
        "translation_prompt": "Into Spanish",
        "custom_actions": [
            {"id": "polite", "name": "Polite", "hotkey": "<ctrl>+p", "prompt": "Be polite"},
            {"name": "No id", "hotkey": "<ctrl>+n", "prompt": "x"},
            {"id": "short", "hotkey": "<ctrl>+s", "prompt": "Shorter"}
        ],
        "some_future_key": [1, 2, 3]
    })";

    Config config;
    std::string error;
    assert(parse_settings(text, config, error));

    assert(config.dictate_hotkey == "<ctrl>+<alt>+space");
    assert(config.translate_hotkey.empty());
    assert(config.language == "ru");
    assert(!config.filter_fillers);
    assert(config.history_size == 5);
    assert(config.streaming);
    assert(config.device_id == 3);
    assert(config.model_quality == ModelQuality::Fast);
    assert(config.get_model_path() == "models/ggml-tiny.bin");
    assert(config.n_threads == 8);
    assert(config.quiet_threshold_db < -40.0f && config.quiet_threshold_db > -41.0f);
    assert(config.openai_api_key == "sk-test");
    assert(config.translation_prompt == "Into Spanish");

    assert(config.custom_actions.size() == 2);
    assert(config.custom_actions[1].name == "short");  // name defaults to id

    auto actions = config.actions();
    assert(actions.size() == 4);  // translate is disabled
    assert(actions[0].id == "dictate");
    assert(actions[1].id == "fix");
    assert(actions[2].id == "custom:polite");
    assert(actions[2].instruction == "Be polite");
    assert(actions[3].kind == ActionKind::Custom);

    std::cout << "  PASS" << std::endl;
}

void test_history_size_bounds() {
    std::cout << "Testing history_size validation..." << std::endl;

    Config config;
    std::string error;
    assert(!parse_settings(R"({"history_size": -5})", config, error));
    assert(error.find("history_size") != std::string::npos);
    assert(config.history_size == 20);

    assert(parse_settings(R"({"history_size": 0})", config, error));
    assert(config.history_size == 0);

    std::cout << "  PASS" << std::endl;
}

void test_null_microphone() {
    std::cout << "Testing null microphone..." << std::endl;

    Config config;
    config.device_id = 4;
    std::string error;
    assert(parse_settings(R"({"microphone_id": null})", config, error));
    assert(config.device_id == -1);

    std::cout << "  PASS" << std::endl;
}

void test_invalid_documents() {
    std::cout << "Testing invalid documents..." << std::endl;

    const char* invalid[] = {
        "{ not json",
        "[1, 2]",
        R"({"history_size": "lots"})",
        R"({"model_quality": "ultra"})",
        R"({"hotkey": 42})",
        R"({"history_size": -1})",
    };

    for (const char* text : invalid) {
        Config config;
        config.language = "de";
        std::string error;
        assert(!parse_settings(text, config, error));
        assert(!error.empty());
        // Untouched on failure
        assert(config.language == "de");
        assert(config.dictate_hotkey == "<cmd>+<shift>+d");
    }

    std::cout << "  PASS" << std::endl;
}

void test_round_trip() {
    std::cout << "Testing serialize then parse..." << std::endl;

    Config original;
    original.dictate_hotkey = "<alt>+d";
    original.language = "uk";
    original.streaming = true;
    original.history_size = 7;
    original.model_quality = ModelQuality::Accurate;
    original.custom_actions.push_back({"emoji", "Emoji", "<ctrl>+e", "Add emoji"});
    original.initial_prompt = "Kubernetes, nginx, PostgreSQL";
    original.audio_preprocessing = false;

    Config loaded;
    std::string error;
    assert(parse_settings(serialize_settings(original), loaded, error));
    assert(loaded.dictate_hotkey == "<alt>+d");
    assert(loaded.language == "uk");
    assert(loaded.streaming);
    assert(loaded.history_size == 7);
    assert(loaded.model_quality == ModelQuality::Accurate);
    assert(loaded.device_id == -1);
    assert(loaded.custom_actions.size() == 1);
    assert(loaded.custom_actions[0].prompt == "Add emoji");
    assert(loaded.initial_prompt == "Kubernetes, nginx, PostgreSQL");
    assert(!loaded.audio_preprocessing);

    std::cout << "  PASS" << std::endl;
}

void test_file_io() {
    std::cout << "Testing load and save..." << std::endl;

    std::string dir = "/tmp/pushscribe_test_" + std::to_string(getpid());
    std::string path = dir + "/nested/settings.json";

    Config config;
    assert(!load_settings(path, config));

    config.fix_hotkey = "<ctrl>+f";
    assert(save_settings(path, config));

    Config loaded;
    assert(load_settings(path, loaded));
    assert(loaded.fix_hotkey == "<ctrl>+f");

    // Corrupt file: load fails, config unchanged
    {
        std::ofstream file(path);
        file << "{ broken";
    }
    Config untouched;
    assert(!load_settings(path, untouched));
    assert(untouched.fix_hotkey == "<cmd>+<shift>+f");

    std::remove(path.c_str());
    std::remove((dir + "/nested").c_str());
    std::remove(dir.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_environment() {
    std::cout << "Testing OPENAI_API_KEY..." << std::endl;

    setenv("OPENAI_API_KEY", "sk-env", 1);

    Config config;
    apply_environment(config);
    assert(config.openai_api_key == "sk-env");

    // Settings file wins
    Config explicit_key;
    explicit_key.openai_api_key = "sk-file";
    apply_environment(explicit_key);
    assert(explicit_key.openai_api_key == "sk-file");

    unsetenv("OPENAI_API_KEY");

    std::cout << "  PASS" << std::endl;
}

void test_default_path() {
    std::cout << "Testing default settings path..." << std::endl;

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    assert(default_settings_path() == "/tmp/xdg/pushscribe/settings.json");
    unsetenv("XDG_CONFIG_HOME");

    setenv("HOME", "/home/someone", 1);
    assert(default_settings_path() == "/home/someone/.config/pushscribe/settings.json");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Settings Test Suite ===" << std::endl << std::endl;

    test_defaults_untouched();
    test_parse_fields();
    test_history_size_bounds();
    test_null_microphone();
    test_invalid_documents();
    test_round_trip();
    test_file_io();
    test_environment();
    test_default_path();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
