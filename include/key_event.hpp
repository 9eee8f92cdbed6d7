#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace pushscribe {

// A key notification as delivered by a keyboard hook. Sources fill in
// whatever they know; every field is optional.
struct RawKeyEvent {
    bool pressed = false;
    int32_t code = -1;      // Physical key code (evdev KEY_*), -1 if unavailable
    std::string name;       // Symbolic name declared by the source ("shift_r", "space")
    std::string utf8;       // Produced character, may be empty or malformed
};

enum class KeyEventKind {
    PhysicalCode,
    NamedKey,
    Character,
    Unresolved
};

// Closed set of key identities the resolver hands out at the hook boundary.
struct KeyEvent {
    KeyEventKind kind = KeyEventKind::Unresolved;
    uint32_t code = 0;      // PhysicalCode
    std::string text;       // NamedKey name or Character (single code point, UTF-8)

    static KeyEvent physical(uint32_t code) {
        KeyEvent e;
        e.kind = KeyEventKind::PhysicalCode;
        e.code = code;
        return e;
    }

    static KeyEvent named(std::string name) {
        KeyEvent e;
        e.kind = KeyEventKind::NamedKey;
        e.text = std::move(name);
        return e;
    }

    static KeyEvent character(std::string utf8) {
        KeyEvent e;
        e.kind = KeyEventKind::Character;
        e.text = std::move(utf8);
        return e;
    }

    static KeyEvent unresolved() { return KeyEvent(); }
};

// Layout-independent key identity. A default-constructed key is "unknown"
// and never compares equal to anything, itself included.
class LogicalKey {
public:
    LogicalKey() = default;
    explicit LogicalKey(std::string id) : id_(std::move(id)) {}

    bool is_unknown() const { return id_.empty(); }
    const std::string& id() const { return id_; }

    bool operator==(const LogicalKey& other) const {
        return !is_unknown() && id_ == other.id_;
    }
    bool operator!=(const LogicalKey& other) const { return !(*this == other); }

private:
    std::string id_;
};

enum class Modifier : uint32_t {
    Cmd   = 1u << 0,
    Ctrl  = 1u << 1,
    Alt   = 1u << 2,
    Shift = 1u << 3
};

using ModifierSet = uint32_t;

inline ModifierSet modifier_bit(Modifier m) { return static_cast<ModifierSet>(m); }

inline bool has_modifier(ModifierSet set, Modifier m) {
    return (set & modifier_bit(m)) != 0;
}

// True when every modifier in `required` is present in `held`.
inline bool contains_all(ModifierSet held, ModifierSet required) {
    return (held & required) == required;
}

inline const char* modifier_name(Modifier m) {
    switch (m) {
        case Modifier::Cmd: return "cmd";
        case Modifier::Ctrl: return "ctrl";
        case Modifier::Alt: return "alt";
        case Modifier::Shift: return "shift";
    }
    return "";
}

} // namespace pushscribe
