#include "session_arbiter.hpp"
#include "audio_level.hpp"
#include <exception>
#include <iostream>
#include <set>

namespace pushscribe {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

SessionArbiter::SessionArbiter(MasterKeyDispatcher& dispatcher,
                               AudioSource& audio,
                               SpeechTranscriber& transcriber,
                               TextTransformer& transformer,
                               TextInserter& inserter,
                               StatusListener& status,
                               DictationHistory& history,
                               const Config& config)
    : dispatcher_(dispatcher)
    , audio_(audio)
    , transcriber_(transcriber)
    , transformer_(transformer)
    , inserter_(inserter)
    , status_(status)
    , history_(history)
    , config_(std::make_shared<const Config>(config)) {
}

SessionArbiter::~SessionArbiter() {
    shutdown();
}

size_t SessionArbiter::reload(const Config& config) {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    std::vector<BoundAction> old_actions;
    {
        std::lock_guard<std::recursive_mutex> lock(session_mutex_);
        if (shutting_down_) return 0;
        old_actions.swap(actions_);
    }

    // Returns only once the hook thread is no longer inside these bindings
    for (auto& bound : old_actions) {
        dispatcher_.unregister_listener(bound.binding.get());
    }

    std::vector<KeyListener*> to_register;
    {
        std::lock_guard<std::recursive_mutex> lock(session_mutex_);

        // A binding held down across the reload releases here, which routes
        // like any other release and ends its session.
        for (auto& bound : old_actions) {
            bound.binding->stop();
        }

        config_ = std::make_shared<const Config>(config);
        history_.set_max_entries(config.history_size);

        std::set<std::string> seen_ids;
        for (const auto& action : config.actions()) {
            if (!seen_ids.insert(action.id).second) {
                std::cerr << "Skipping action '" << action.id << "': duplicate id" << std::endl;
                continue;
            }
            if (action.kind == ActionKind::Custom && trim(action.instruction).empty()) {
                std::cerr << "Skipping action '" << action.id << "': empty instruction" << std::endl;
                continue;
            }

            HotkeyParseResult parsed = parse_hotkey(action.hotkey);
            if (!parsed.success) {
                std::cerr << "Skipping action '" << action.id << "': " << parsed.error << std::endl;
                continue;
            }

            BoundAction bound;
            bound.action = action;
            bound.binding.reset(new PushToTalkBinding(action.id, parsed.spec, *this));
            to_register.push_back(bound.binding.get());

            std::cout << "Hotkey " << format_for_display(parsed.spec)
                      << " -> " << action.name << std::endl;
            actions_.push_back(std::move(bound));
        }
    }

    size_t registered = 0;
    for (KeyListener* listener : to_register) {
        if (dispatcher_.register_listener(listener)) {
            registered++;
        }
    }
    return registered;
}

void SessionArbiter::shutdown() {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    std::vector<BoundAction> old_actions;
    {
        std::lock_guard<std::recursive_mutex> lock(session_mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
        old_actions.swap(actions_);
    }

    for (auto& bound : old_actions) {
        dispatcher_.unregister_listener(bound.binding.get());
    }

    {
        std::lock_guard<std::recursive_mutex> lock(session_mutex_);
        for (auto& bound : old_actions) {
            bound.binding->stop();
        }

        // Capture still open without a held binding (e.g. its release was lost)
        if (capturing_) {
            capturing_ = false;
            audio_.set_chunk_callback(nullptr);
            audio_.stop_capture();
            if (active_.streaming) {
                transcriber_.stop_streaming();
            }
            has_active_ = false;
            status_.on_status(AppState::Idle, "Stopped");
        }
    }

    wait_idle();
}

const SessionArbiter::BoundAction* SessionArbiter::find_action_locked(const std::string& action_id) const {
    for (const auto& bound : actions_) {
        if (bound.action.id == action_id) return &bound;
    }
    return nullptr;
}

void SessionArbiter::on_action_press(const std::string& action_id) {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);

    if (shutting_down_ || has_active_) return;

    const BoundAction* bound = find_action_locked(action_id);
    if (!bound) return;
    const ActionConfig& action = bound->action;

    // The previous worker has already cleared the session; reap it
    if (worker_.joinable()) {
        worker_.join();
    }

    std::shared_ptr<const Config> config = config_;
    bool streaming = config->streaming && action.kind == ActionKind::Dictate &&
                     transcriber_.supports_streaming();

    if (streaming) {
        {
            std::lock_guard<std::mutex> stream_lock(stream_mutex_);
            reconciler_.reset();
        }
        if (transcriber_.start_streaming([this](const std::string& text) { apply_partial(text); })) {
            audio_.set_chunk_callback([this](const std::vector<float>& chunk) {
                transcriber_.push_audio(chunk);
            });
        } else {
            std::cerr << "Streaming unavailable, recording in batch mode" << std::endl;
            streaming = false;
        }
    }

    if (!audio_.start_capture(config->device_id, config->sample_rate)) {
        std::cerr << "Failed to start audio capture" << std::endl;
        if (streaming) {
            audio_.set_chunk_callback(nullptr);
            transcriber_.stop_streaming();
        }
        status_.on_status(AppState::Idle, "Microphone unavailable");
        return;
    }

    has_active_ = true;
    capturing_ = true;
    active_.kind = action.kind;
    active_.action_id = action.id;
    active_.start_time = std::chrono::steady_clock::now();
    active_.streaming = streaming;
    active_action_ = action;

    status_.on_status(AppState::Recording, "Recording (" + action.name + ")...");
}

void SessionArbiter::on_action_release(const std::string& action_id) {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);

    if (!has_active_ || !capturing_ || active_.action_id != action_id) return;

    capturing_ = false;
    audio_.set_chunk_callback(nullptr);
    std::vector<float> samples = audio_.stop_capture();

    // Taken from the press: a reload may already have swapped the binding out
    ActionConfig action = active_action_;

    status_.on_status(AppState::Processing, "Transcribing...");

    if (worker_.joinable()) {
        worker_.join();
    }

    if (active_.streaming) {
        worker_ = std::thread(&SessionArbiter::run_streaming_session, this, action);
    } else {
        worker_ = std::thread(&SessionArbiter::run_session, this, action, std::move(samples));
    }
}

void SessionArbiter::run_session(ActionConfig action, std::vector<float> samples) {
    try {
        std::shared_ptr<const Config> config = this->config();

        float level = audio_level_db(samples);
        if (samples.empty() || level < config->quiet_threshold_db) {
            std::cout << "Recording too quiet (" << level << " dBFS), skipping" << std::endl;
            finish_session();
            return;
        }

        TranscriptionResult result = transcriber_.transcribe(samples, config->sample_rate);
        if (!result.success) {
            std::cerr << "Transcription failed: " << result.error << std::endl;
            finish_session();
            return;
        }

        std::string text = trim(result.text);
        if (action.kind == ActionKind::Dictate && config->filter_fillers) {
            text = trim(filler_filter_.process(text));
        }
        if (text.empty()) {
            std::cout << "Nothing recognized" << std::endl;
            finish_session();
            return;
        }

        if (action.kind != ActionKind::Dictate) {
            std::string instruction = trim(action.instruction).empty()
                ? default_instruction(action.kind)
                : action.instruction;

            TransformResult transformed = transformer_.transform(text, instruction);
            if (!transformed.success) {
                if (transformed.api_key_missing) {
                    status_.on_alert("API key missing",
                                     "Set openai_api_key in settings.json or the OPENAI_API_KEY environment variable.");
                } else {
                    status_.on_alert("Text transform failed", transformed.error);
                }
                finish_session();
                return;
            }
            text = trim(transformed.text);
        }

        if (!text.empty()) {
            deliver(text, action.id);
        }
    } catch (const std::exception& e) {
        std::cerr << "Session '" << action.id << "' failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Session '" << action.id << "' failed: unknown exception" << std::endl;
    }

    finish_session();
}

void SessionArbiter::run_streaming_session(ActionConfig action) {
    try {
        // No partial callbacks arrive once stop_streaming() has returned
        std::string final_text = transcriber_.stop_streaming();

        std::string committed;
        {
            std::lock_guard<std::mutex> stream_lock(stream_mutex_);
            std::string trimmed = trim(final_text);
            if (!trimmed.empty()) {
                StreamEdit edit = reconciler_.update(trimmed);
                if (edit.delete_count > 0) inserter_.delete_backward(edit.delete_count);
                if (!edit.insert_text.empty()) inserter_.insert(edit.insert_text);
            }
            committed = reconciler_.last_committed();
        }

        if (!committed.empty()) {
            history_.add(committed, action.id);
            status_.on_history_changed(history_.recent(10));
        }
    } catch (const std::exception& e) {
        std::cerr << "Streaming session '" << action.id << "' failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Streaming session '" << action.id << "' failed: unknown exception" << std::endl;
    }

    finish_session();
}

void SessionArbiter::apply_partial(const std::string& text) {
    std::lock_guard<std::mutex> stream_lock(stream_mutex_);

    std::string trimmed = trim(text);
    if (trimmed.empty()) return;

    StreamEdit edit = reconciler_.update(trimmed);
    if (edit.delete_count > 0 && !inserter_.delete_backward(edit.delete_count)) {
        std::cerr << "Failed to delete " << edit.delete_count << " characters" << std::endl;
    }
    if (!edit.insert_text.empty() && !inserter_.insert(edit.insert_text)) {
        std::cerr << "Failed to insert partial text" << std::endl;
    }
}

void SessionArbiter::deliver(const std::string& text, const std::string& action_id) {
    history_.add(text, action_id);
    status_.on_history_changed(history_.recent(10));

    if (!inserter_.insert(text)) {
        std::cerr << "Failed to insert text" << std::endl;
    }
}

void SessionArbiter::finish_session() {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);
    has_active_ = false;
    status_.on_status(AppState::Idle, "Ready");
}

void SessionArbiter::wait_idle() {
    std::thread worker;
    {
        std::lock_guard<std::recursive_mutex> lock(session_mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

bool SessionArbiter::active_session(ActiveSession& out) const {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);
    if (!has_active_) return false;
    out = active_;
    return true;
}

size_t SessionArbiter::binding_count() const {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);
    return actions_.size();
}

std::shared_ptr<const Config> SessionArbiter::config() const {
    std::lock_guard<std::recursive_mutex> lock(session_mutex_);
    return config_;
}

} // namespace pushscribe
