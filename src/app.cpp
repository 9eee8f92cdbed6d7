#include "app.hpp"
#include "keyboard_hook.hpp"
#include "settings.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>

namespace pushscribe {

void CommandLineOverrides::apply(Config& config) const {
    if (quality_set) config.model_quality = quality;
    if (!model_dir.empty()) config.model_dir = model_dir;
    if (threads > 0) config.n_threads = threads;
    if (!language.empty()) config.language = language;
    if (device_set) config.device_id = device_id;
    if (streaming) config.streaming = true;
    if (no_filter) config.filter_fillers = false;
}

App::App() = default;

App::~App() {
    shutdown();
}

Config App::load_config() const {
    Config config;
    if (!load_settings(settings_path_, config)) {
        std::cout << "Using default settings" << std::endl;
    }
    apply_environment(config);
    overrides_.apply(config);
    return config;
}

bool App::initialize(const std::string& settings_path, const CommandLineOverrides& overrides) {
    settings_path_ = settings_path;
    overrides_ = overrides;

    // First run: write the defaults so there is a file to edit
    if (!std::ifstream(settings_path_).good()) {
        if (save_settings(settings_path_, Config())) {
            std::cout << "Wrote default settings to " << settings_path_ << std::endl;
        }
    }

    Config config = load_config();

    audio_ = std::make_unique<AudioCapture>(config.channels, config.frames_per_buffer);
    if (!audio_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    std::cout << "Audio capture initialized" << std::endl;

    transcriber_ = std::make_unique<Transcriber>();
    if (!transcriber_->initialize(config.get_model_path(), config.n_threads)) {
        std::cerr << "Failed to initialize transcriber" << std::endl;
        return false;
    }
    transcriber_->set_language(config.language);
    transcriber_->set_profile(get_profile(config.model_quality));
    transcriber_->set_preprocessing(config.audio_preprocessing);
    if (!config.initial_prompt.empty()) {
        transcriber_->set_initial_prompt(config.initial_prompt);
        std::cout << "Using initial prompt: \"" << config.initial_prompt << "\"" << std::endl;
    }
    std::cout << "Transcriber initialized (quality: " << get_profile(config.model_quality).name
              << ", language: " << config.language << ")" << std::endl;

    transformer_ = std::make_unique<ChatTransformer>(config.openai_api_key, config.transform_model);
    if (config.openai_api_key.empty()) {
        std::cout << "No OpenAI API key: translate and fix actions will report an error" << std::endl;
    }

    history_.set_max_entries(config.history_size);

    dispatcher_ = std::make_unique<MasterKeyDispatcher>(std::make_unique<EvdevKeyboardHook>());
    arbiter_ = std::make_unique<SessionArbiter>(*dispatcher_, *audio_, *transcriber_, *transformer_,
                                                inserter_, tray_, history_, config);

    size_t registered = arbiter_->reload(config);
    if (registered == 0) {
        std::cerr << "No hotkeys could be registered" << std::endl;
        return false;
    }
    std::cout << registered << " hotkey(s) active" << std::endl;

    tray_.on_status(AppState::Idle, "Ready");
    return true;
}

bool App::reload() {
    if (!arbiter_) return false;

    std::cout << "Reloading settings from " << settings_path_ << std::endl;
    Config config = load_config();

    transformer_->set_api_key(config.openai_api_key);
    transformer_->set_model(config.transform_model);

    size_t registered = arbiter_->reload(config);
    std::cout << registered << " hotkey(s) active" << std::endl;
    if (registered == 0) {
        tray_.on_alert("No hotkeys", "None of the configured hotkeys could be registered.");
        return false;
    }
    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    if (arbiter_) {
        arbiter_->shutdown();
        arbiter_.reset();
    }

    if (audio_) {
        audio_->shutdown();
    }

    if (transcriber_) {
        transcriber_->shutdown();
    }
}

int App::run() {
    if (!arbiter_) return 1;

    std::cout << "\n=== pushscribe ready ===" << std::endl;
    std::cout << "Hold a hotkey to record, release to transcribe and type." << std::endl;
    std::cout << "Send SIGHUP to reload " << settings_path_ << "\n" << std::endl;

    while (!should_quit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (reload_requested_.exchange(false)) {
            reload();
        }
    }

    std::cout << "Shutting down..." << std::endl;
    return 0;
}

} // namespace pushscribe
