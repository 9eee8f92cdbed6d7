#include "push_to_talk.hpp"
#include "key_resolver.hpp"
#include <exception>
#include <iostream>

namespace pushscribe {

PushToTalkBinding::PushToTalkBinding(std::string id, const HotkeySpec& spec, ActionHandler& handler)
    : id_(std::move(id))
    , spec_(spec)
    , handler_(handler) {
}

void PushToTalkBinding::on_key_event(const RawKeyEvent& event) {
    // Callbacks run with mutex_ held so press/release can never interleave
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;

    LogicalKey key = KeyResolver::resolve(event);

    if (event.pressed) {
        handle_press(event, key);
    } else {
        handle_release(event, key);
    }
}

void PushToTalkBinding::handle_press(const RawKeyEvent& event, const LogicalKey& key) {
    Modifier modifier;
    if (KeyResolver::modifier_of(key, modifier)) {
        held_ |= modifier_bit(modifier);
        return;
    }

    if (pressed_) return;  // key repeat

    if (KeyResolver::matches(event, spec_.main_key) &&
        contains_all(held_, spec_.required_modifiers)) {
        pressed_ = true;
        fire_press();
    }
}

void PushToTalkBinding::handle_release(const RawKeyEvent& event, const LogicalKey& key) {
    Modifier modifier;
    if (KeyResolver::modifier_of(key, modifier)) {
        held_ &= ~modifier_bit(modifier);
        if (pressed_ && !contains_all(held_, spec_.required_modifiers)) {
            pressed_ = false;
            fire_release();
        }
        return;
    }

    if (pressed_ && KeyResolver::matches(event, spec_.main_key)) {
        pressed_ = false;
        fire_release();
    }
}

void PushToTalkBinding::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;

    stopped_ = true;
    held_ = 0;
    if (pressed_) {
        pressed_ = false;
        fire_release();
    }
}

bool PushToTalkBinding::is_pressed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pressed_;
}

bool PushToTalkBinding::is_stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

ModifierSet PushToTalkBinding::held_modifiers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

void PushToTalkBinding::fire_press() {
    try {
        handler_.on_action_press(id_);
    } catch (const std::exception& e) {
        std::cerr << "Press handler for '" << id_ << "' failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Press handler for '" << id_ << "' failed: unknown exception" << std::endl;
    }
}

void PushToTalkBinding::fire_release() {
    try {
        handler_.on_action_release(id_);
    } catch (const std::exception& e) {
        std::cerr << "Release handler for '" << id_ << "' failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Release handler for '" << id_ << "' failed: unknown exception" << std::endl;
    }
}

} // namespace pushscribe
