#include "app.hpp"
#include "audio_capture.hpp"
#include "config.hpp"
#include "settings.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>

static pushscribe::App* g_app = nullptr;

void signal_handler(int signum) {
    if (!g_app) return;
    if (signum == SIGHUP) {
        g_app->request_reload();
    } else {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE   Settings file (default: " << pushscribe::default_settings_path() << ")\n"
              << "  -q, --quality MODE  Quality mode: fast, balanced, accurate, best (default: balanced)\n"
              << "  -m, --model-dir DIR Directory containing models (default: models)\n"
              << "  -t, --threads N     Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG Language code or 'auto' (default: auto)\n"
              << "  -d, --device ID     Input device id (see --list-devices)\n"
              << "  --streaming         Type partial text while speaking (dictate only)\n"
              << "  --no-filter         Keep filler words (um, uh, ...)\n"
              << "  --list-devices      List input devices and exit\n"
              << "  -h, --help          Show this help\n"
              << "\nQuality Modes:\n"
              << "  fast     - Fastest (tiny model)\n"
              << "  balanced - Good balance (base model)\n"
              << "  accurate - High accuracy (small model)\n"
              << "  best     - Highest accuracy (medium model)\n"
              << "\nHotkeys (from the settings file):\n"
              << "  <cmd>+<shift>+d  Dictate\n"
              << "  <cmd>+<shift>+t  Translate (needs an OpenAI API key)\n"
              << "  <cmd>+<shift>+f  Smart fix (needs an OpenAI API key)\n"
              << "  Hold to record, release to transcribe and type. <cmd> is the Super key.\n"
              << "\nSignals:\n"
              << "  SIGHUP reloads the settings file, SIGINT/SIGTERM quit.\n"
              << "\nFirst run:\n"
              << "  Download a model: curl -L -o models/ggml-base.bin \\\n"
              << "    https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin\n"
              << std::endl;
}

static int list_devices() {
    pushscribe::AudioCapture capture;
    if (!capture.initialize()) {
        return 1;
    }

    auto devices = capture.enumerate_devices();
    if (devices.empty()) {
        std::cout << "No input devices found" << std::endl;
    }
    for (const auto& device : devices) {
        std::cout << "  [" << device.id << "] " << device.name
                  << " (" << device.channels << " ch)" << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    pushscribe::CommandLineOverrides overrides;
    std::string settings_path = pushscribe::default_settings_path();

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            return list_devices();
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            settings_path = argv[++i];
        }
        else if ((strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quality") == 0) && i + 1 < argc) {
            const char* mode = argv[++i];
            if (!pushscribe::parse_model_quality(mode, overrides.quality)) {
                std::cerr << "Unknown quality mode: " << mode << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            overrides.quality_set = true;
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            overrides.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            overrides.threads = std::atoi(argv[++i]);
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            overrides.language = argv[++i];
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device") == 0) && i + 1 < argc) {
            overrides.device_id = std::atoi(argv[++i]);
            overrides.device_set = true;
        }
        else if (strcmp(argv[i], "--streaming") == 0) {
            overrides.streaming = true;
        }
        else if (strcmp(argv[i], "--no-filter") == 0) {
            overrides.no_filter = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);

    pushscribe::App app;
    g_app = &app;

    std::cout << "pushscribe - push-to-talk dictation\n" << std::endl;
    std::cout << "Settings: " << settings_path << std::endl;
    std::cout << std::endl;

    if (!app.initialize(settings_path, overrides)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    app.shutdown();
    g_app = nullptr;
    return result;
}
