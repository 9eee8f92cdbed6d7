#pragma once

#include "audio_capture.hpp"
#include "config.hpp"
#include "console_tray.hpp"
#include "history.hpp"
#include "key_dispatcher.hpp"
#include "session_arbiter.hpp"
#include "text_inserter.hpp"
#include "text_transformer.hpp"
#include "transcriber.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace pushscribe {

// Command line settings. They win over the settings file, at startup and
// on every reload.
struct CommandLineOverrides {
    bool quality_set = false;
    ModelQuality quality = ModelQuality::Balanced;
    std::string model_dir;
    int threads = 0;
    std::string language;
    bool device_set = false;
    int device_id = -1;
    bool streaming = false;
    bool no_filter = false;

    void apply(Config& config) const;
};

// Process context: owns the one keyboard dispatcher, the collaborators and
// the session arbiter.
class App {
public:
    App();
    ~App();

    bool initialize(const std::string& settings_path, const CommandLineOverrides& overrides);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Both are safe to call from a signal handler
    void quit() { should_quit_.store(true); }
    void request_reload() { reload_requested_.store(true); }

    // Re-read the settings file and rebuild the hotkey bindings
    bool reload();

private:
    Config load_config() const;

    std::string settings_path_;
    CommandLineOverrides overrides_;

    DictationHistory history_;
    ConsoleTray tray_;
    X11TextInserter inserter_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<ChatTransformer> transformer_;

    // Declared before the arbiter so it outlives it: the hook is never
    // stopped and goes away only with the process
    std::unique_ptr<MasterKeyDispatcher> dispatcher_;
    std::unique_ptr<SessionArbiter> arbiter_;

    std::atomic<bool> should_quit_{false};
    std::atomic<bool> reload_requested_{false};
};

} // namespace pushscribe
