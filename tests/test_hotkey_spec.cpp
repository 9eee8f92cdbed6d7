// Tests for hotkey parsing and display

#include "hotkey_spec.hpp"
#include <iostream>
#include <cassert>

using namespace pushscribe;

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

void test_parse_default_hotkeys() {
    std::cout << "Testing default hotkeys..." << std::endl;

    HotkeyParseResult r = parse_hotkey("<cmd>+<shift>+d");
    assert(r.success);
    assert(r.error.empty());
    assert(r.spec.required_modifiers == (modifier_bit(Modifier::Cmd) | modifier_bit(Modifier::Shift)));
    assert(r.spec.main_key.id() == "d");

    r = parse_hotkey("<cmd>+<shift>+t");
    assert(r.success && r.spec.main_key.id() == "t");

    std::cout << "  PASS" << std::endl;
}

void test_display_round_trip() {
    std::cout << "Testing display formatting..." << std::endl;

    HotkeyParseResult r = parse_hotkey("<cmd>+<shift>+d");
    assert(r.success);

    std::string display = format_for_display(r.spec);
    assert(contains(display, "⌘"));
    assert(contains(display, "⇧"));
    assert(contains(display, "D"));
    assert(display == "⌘⇧D");

    // Glyph order is fixed regardless of input order
    r = parse_hotkey("alt+ctrl+shift+cmd+space");
    assert(r.success);
    assert(format_for_display(r.spec) == "⌘⇧⌃⌥Space");

    r = parse_hotkey("ctrl+f5");
    assert(r.success);
    assert(format_for_display(r.spec) == "⌃F5");

    std::cout << "  PASS" << std::endl;
}

void test_synonyms_and_spacing() {
    std::cout << "Testing synonyms and spacing..." << std::endl;

    HotkeyParseResult a = parse_hotkey(" Command + Option + K ");
    assert(a.success);
    assert(has_modifier(a.spec.required_modifiers, Modifier::Cmd));
    assert(has_modifier(a.spec.required_modifiers, Modifier::Alt));
    assert(a.spec.main_key.id() == "k");

    HotkeyParseResult b = parse_hotkey("<super>+<control>+k");
    assert(b.success);
    assert(has_modifier(b.spec.required_modifiers, Modifier::Cmd));
    assert(has_modifier(b.spec.required_modifiers, Modifier::Ctrl));

    HotkeyParseResult c = parse_hotkey("win+opt+k");
    assert(c.success);
    assert(c.spec.required_modifiers == (modifier_bit(Modifier::Cmd) | modifier_bit(Modifier::Alt)));

    // A bare key is a valid hotkey
    HotkeyParseResult bare = parse_hotkey("f9");
    assert(bare.success && bare.spec.required_modifiers == 0 && bare.spec.main_key.id() == "f9");

    std::cout << "  PASS" << std::endl;
}

void test_invalid_syntax() {
    std::cout << "Testing invalid hotkeys..." << std::endl;

    const char* invalid[] = {
        "",
        "   ",
        "<cmd>+<shift>",        // no main key
        "<cmd>+a+b",            // two main keys
        "<cmd>++d",             // empty token
        "<cmd>+",               // trailing plus
        "<cmd>+<hyper>+d",      // unknown key
    };

    for (const char* text : invalid) {
        HotkeyParseResult r = parse_hotkey(text);
        assert(!r.success);
        assert(contains(r.error, "invalid hotkey syntax"));
    }

    std::cout << "  PASS" << std::endl;
}

void test_canonical_string() {
    std::cout << "Testing canonical form..." << std::endl;

    HotkeyParseResult r = parse_hotkey("Shift+Command+D");
    assert(r.success);
    assert(hotkey_to_string(r.spec) == "<cmd>+<shift>+d");

    HotkeyParseResult again = parse_hotkey(hotkey_to_string(r.spec));
    assert(again.success);
    assert(again.spec.required_modifiers == r.spec.required_modifiers);
    assert(again.spec.main_key == r.spec.main_key);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey Spec Test Suite ===" << std::endl << std::endl;

    test_parse_default_hotkeys();
    test_display_round_trip();
    test_synonyms_and_spacing();
    test_invalid_syntax();
    test_canonical_string();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
