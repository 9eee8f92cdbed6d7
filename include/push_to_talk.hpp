#pragma once

#include "hotkey_spec.hpp"
#include "key_dispatcher.hpp"

#include <mutex>
#include <string>

namespace pushscribe {

// Receives the press/release edges of every binding, keyed by action id
class ActionHandler {
public:
    virtual ~ActionHandler() = default;
    virtual void on_action_press(const std::string& action_id) = 0;
    virtual void on_action_release(const std::string& action_id) = 0;
};

// Push-to-talk state machine for one configured action.
//
// Released -> Pressed when the main key goes down while all required
// modifiers are held; Pressed -> Released when the main key or a required
// modifier goes up. Key repeat while Pressed is ignored, so press and
// release callbacks strictly alternate.
class PushToTalkBinding : public KeyListener {
public:
    PushToTalkBinding(std::string id, const HotkeySpec& spec, ActionHandler& handler);

    PushToTalkBinding(const PushToTalkBinding&) = delete;
    PushToTalkBinding& operator=(const PushToTalkBinding&) = delete;

    void on_key_event(const RawKeyEvent& event) override;

    // Ignore all further events. A binding stopped while Pressed delivers
    // one synthetic release first.
    void stop();

    bool is_pressed() const;
    bool is_stopped() const;
    ModifierSet held_modifiers() const;

    const std::string& id() const { return id_; }
    const HotkeySpec& spec() const { return spec_; }

private:
    void handle_press(const RawKeyEvent& event, const LogicalKey& key);
    void handle_release(const RawKeyEvent& event, const LogicalKey& key);
    void fire_press();
    void fire_release();

    const std::string id_;
    const HotkeySpec spec_;
    ActionHandler& handler_;

    mutable std::mutex mutex_;
    bool pressed_ = false;
    bool stopped_ = false;
    ModifierSet held_ = 0;
};

} // namespace pushscribe
