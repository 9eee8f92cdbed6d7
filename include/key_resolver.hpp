#pragma once

#include "key_event.hpp"
#include <string>

namespace pushscribe {

// Maps raw keyboard events to layout-independent logical keys.
//
// Resolution priority is strict: a physical key code known to the table
// always wins, then a declared symbolic name, then the produced character
// (lower-cased and corrected from Cyrillic layouts to the QWERTY position).
// None of these functions throw; anything unresolvable becomes unknown.
class KeyResolver {
public:
    // Boundary mapping into the closed KeyEvent set
    static KeyEvent classify(const RawKeyEvent& raw);

    static LogicalKey resolve(const RawKeyEvent& raw);
    static LogicalKey resolve(const KeyEvent& event);

    // Layout-robust comparison used by bindings: tries the physical code,
    // then the produced character, then the declared name. The first field
    // that resolves decides the outcome.
    static bool matches(const RawKeyEvent& raw, const LogicalKey& key);

    // Per-field lookups
    static LogicalKey from_physical_code(uint32_t code);
    static LogicalKey from_name(const std::string& name);
    static LogicalKey from_character(const std::string& utf8);

    // Hotkey token vocabulary: a symbolic name or a single character
    static LogicalKey key_from_name(const std::string& token);

    // Returns true and sets `out` when `key` is one of cmd/ctrl/alt/shift
    static bool modifier_of(const LogicalKey& key, Modifier& out);
};

} // namespace pushscribe
