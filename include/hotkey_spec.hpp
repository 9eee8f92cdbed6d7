#pragma once

#include "key_event.hpp"
#include <string>

namespace pushscribe {

// Required modifiers plus exactly one main key
struct HotkeySpec {
    ModifierSet required_modifiers = 0;
    LogicalKey main_key;
};

struct HotkeyParseResult {
    HotkeySpec spec;
    bool success = false;
    std::string error;
};

// Parse "<cmd>+<shift>+d" style strings. Tokens are split on '+', angle
// brackets are optional, and "command"/"control"/"option" are accepted as
// synonyms. Fails when no main key (or more than one) remains after the
// modifier tokens are taken out.
HotkeyParseResult parse_hotkey(const std::string& text);

// Modifier glyphs followed by the upper-cased main key, e.g. "⌘⇧D"
std::string format_for_display(const HotkeySpec& spec);

// Canonical "<cmd>+<shift>+d" form
std::string hotkey_to_string(const HotkeySpec& spec);

} // namespace pushscribe
