// Tests for the push-to-talk binding state machine

#include "push_to_talk.hpp"
#include <linux/input-event-codes.h>
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace pushscribe;

namespace {

class RecordingHandler : public ActionHandler {
public:
    void on_action_press(const std::string& id) override { edges.push_back("+" + id); }
    void on_action_release(const std::string& id) override { edges.push_back("-" + id); }
    std::vector<std::string> edges;
};

RawKeyEvent key(int32_t code, bool pressed) {
    RawKeyEvent e;
    e.code = code;
    e.pressed = pressed;
    return e;
}

HotkeySpec cmd_shift_d() {
    HotkeyParseResult r = parse_hotkey("<cmd>+<shift>+d");
    assert(r.success);
    return r.spec;
}

} // namespace

void test_press_release() {
    std::cout << "Testing press and release..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    binding.on_key_event(key(KEY_LEFTMETA, true));
    binding.on_key_event(key(KEY_LEFTSHIFT, true));
    assert(binding.held_modifiers() == (modifier_bit(Modifier::Cmd) | modifier_bit(Modifier::Shift)));

    binding.on_key_event(key(KEY_D, true));
    assert(binding.is_pressed());
    binding.on_key_event(key(KEY_D, false));
    assert(!binding.is_pressed());

    assert(handler.edges.size() == 2);
    assert(handler.edges[0] == "+dictate");
    assert(handler.edges[1] == "-dictate");

    std::cout << "  PASS" << std::endl;
}

void test_key_repeat_ignored() {
    std::cout << "Testing key repeat..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    binding.on_key_event(key(KEY_LEFTMETA, true));
    binding.on_key_event(key(KEY_LEFTSHIFT, true));
    for (int i = 0; i < 5; ++i) {
        binding.on_key_event(key(KEY_D, true));
    }
    binding.on_key_event(key(KEY_D, false));
    binding.on_key_event(key(KEY_D, false));  // stray second release

    assert(handler.edges.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_modifier_release_ends_press() {
    std::cout << "Testing modifier released first..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    binding.on_key_event(key(KEY_LEFTMETA, true));
    binding.on_key_event(key(KEY_RIGHTSHIFT, true));
    binding.on_key_event(key(KEY_D, true));
    binding.on_key_event(key(KEY_RIGHTSHIFT, false));
    assert(!binding.is_pressed());
    assert(handler.edges.size() == 2 && handler.edges[1] == "-dictate");

    // Main key comes up afterwards: no second release
    binding.on_key_event(key(KEY_D, false));
    assert(handler.edges.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_missing_modifiers() {
    std::cout << "Testing main key without modifiers..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    binding.on_key_event(key(KEY_D, true));
    binding.on_key_event(key(KEY_D, false));

    binding.on_key_event(key(KEY_LEFTSHIFT, true));
    binding.on_key_event(key(KEY_D, true));
    binding.on_key_event(key(KEY_D, false));

    // Other keys with the right modifiers
    binding.on_key_event(key(KEY_LEFTMETA, true));
    binding.on_key_event(key(KEY_T, true));
    binding.on_key_event(key(KEY_T, false));

    assert(handler.edges.empty());

    // Extra modifiers are allowed
    binding.on_key_event(key(KEY_LEFTCTRL, true));
    binding.on_key_event(key(KEY_D, true));
    assert(handler.edges.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_layout_independent() {
    std::cout << "Testing character-only events from a Cyrillic layout..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    RawKeyEvent cmd;
    cmd.pressed = true;
    cmd.name = "cmd";
    RawKeyEvent shift;
    shift.pressed = true;
    shift.name = "shift";
    RawKeyEvent ve;
    ve.pressed = true;
    ve.utf8 = "В";

    binding.on_key_event(cmd);
    binding.on_key_event(shift);
    binding.on_key_event(ve);
    assert(binding.is_pressed());

    ve.pressed = false;
    binding.on_key_event(ve);
    assert(!binding.is_pressed());
    assert(handler.edges.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_stop_synthesizes_release() {
    std::cout << "Testing stop while pressed..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("dictate", cmd_shift_d(), handler);

    binding.on_key_event(key(KEY_LEFTMETA, true));
    binding.on_key_event(key(KEY_LEFTSHIFT, true));
    binding.on_key_event(key(KEY_D, true));

    binding.stop();
    assert(binding.is_stopped());
    assert(!binding.is_pressed());
    assert(binding.held_modifiers() == 0);
    assert(handler.edges.size() == 2 && handler.edges[1] == "-dictate");

    // Everything after stop is ignored, including a second stop
    binding.on_key_event(key(KEY_D, false));
    binding.on_key_event(key(KEY_D, true));
    binding.stop();
    assert(handler.edges.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_stop_while_released() {
    std::cout << "Testing stop while released..." << std::endl;

    RecordingHandler handler;
    PushToTalkBinding binding("fix", cmd_shift_d(), handler);
    binding.stop();
    assert(handler.edges.empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Push-to-Talk Test Suite ===" << std::endl << std::endl;

    test_press_release();
    test_key_repeat_ignored();
    test_modifier_release_ends_press();
    test_missing_modifiers();
    test_layout_independent();
    test_stop_synthesizes_release();
    test_stop_while_released();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
