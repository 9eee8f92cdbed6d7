#pragma once

#include "config.hpp"
#include "filler_filter.hpp"
#include "history.hpp"
#include "interfaces.hpp"
#include "key_dispatcher.hpp"
#include "push_to_talk.hpp"
#include "stream_reconciler.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pushscribe {

struct ActiveSession {
    ActionKind kind = ActionKind::Dictate;
    std::string action_id;
    std::chrono::steady_clock::time_point start_time;
    bool streaming = false;
};

// Owns the push-to-talk bindings and enforces "one session at a time".
//
// A press on any binding opens a session (audio capture starts on the hook
// thread); its release stops capture and hands the samples to a worker thread
// that transcribes, optionally transforms, and inserts the text. Presses while
// a session is recording or processing are ignored.
//
// Lock order: reload_mutex_ -> dispatcher -> binding -> session_mutex_.
// The worker only ever takes session_mutex_ and stream_mutex_.
class SessionArbiter : public ActionHandler {
public:
    SessionArbiter(MasterKeyDispatcher& dispatcher,
                   AudioSource& audio,
                   SpeechTranscriber& transcriber,
                   TextTransformer& transformer,
                   TextInserter& inserter,
                   StatusListener& status,
                   DictationHistory& history,
                   const Config& config);
    ~SessionArbiter() override;

    SessionArbiter(const SessionArbiter&) = delete;
    SessionArbiter& operator=(const SessionArbiter&) = delete;

    // Replace every binding with ones built from `config`. A binding that is
    // held down gets its release first. Actions whose hotkey does not parse
    // are logged and skipped. Returns the number of bindings registered.
    size_t reload(const Config& config);

    // Stop all bindings and any capture, then wait for the session worker
    void shutdown();

    // ActionHandler
    void on_action_press(const std::string& action_id) override;
    void on_action_release(const std::string& action_id) override;

    // Blocks until the current session worker (if any) has finished
    void wait_idle();

    bool active_session(ActiveSession& out) const;
    size_t binding_count() const;
    std::shared_ptr<const Config> config() const;

private:
    struct BoundAction {
        ActionConfig action;
        std::unique_ptr<PushToTalkBinding> binding;
    };

    const BoundAction* find_action_locked(const std::string& action_id) const;

    void run_session(ActionConfig action, std::vector<float> samples);
    void run_streaming_session(ActionConfig action);
    void finish_session();

    void apply_partial(const std::string& text);
    void deliver(const std::string& text, const std::string& action_id);

    MasterKeyDispatcher& dispatcher_;
    AudioSource& audio_;
    SpeechTranscriber& transcriber_;
    TextTransformer& transformer_;
    TextInserter& inserter_;
    StatusListener& status_;
    DictationHistory& history_;

    std::mutex reload_mutex_;

    // Recursive: stopping a held binding under this lock re-enters
    // on_action_release on the same thread.
    mutable std::recursive_mutex session_mutex_;
    std::shared_ptr<const Config> config_;
    std::vector<BoundAction> actions_;
    bool has_active_ = false;
    bool capturing_ = false;
    ActiveSession active_;
    ActionConfig active_action_;
    std::thread worker_;
    bool shutting_down_ = false;

    FillerFilter filler_filter_;

    std::mutex stream_mutex_;
    StreamReconciler reconciler_;
};

} // namespace pushscribe
