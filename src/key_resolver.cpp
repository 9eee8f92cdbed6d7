#include "key_resolver.hpp"
#include "utf8.hpp"
#include <linux/input-event-codes.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace pushscribe {

namespace {

// evdev code -> US-QWERTY position name
const std::unordered_map<uint32_t, const char*>& physical_table() {
    static const std::unordered_map<uint32_t, const char*> table = {
        {KEY_ESC, "esc"}, {KEY_1, "1"}, {KEY_2, "2"}, {KEY_3, "3"}, {KEY_4, "4"},
        {KEY_5, "5"}, {KEY_6, "6"}, {KEY_7, "7"}, {KEY_8, "8"}, {KEY_9, "9"},
        {KEY_0, "0"}, {KEY_MINUS, "-"}, {KEY_EQUAL, "="}, {KEY_BACKSPACE, "backspace"},
        {KEY_TAB, "tab"},
        {KEY_Q, "q"}, {KEY_W, "w"}, {KEY_E, "e"}, {KEY_R, "r"}, {KEY_T, "t"},
        {KEY_Y, "y"}, {KEY_U, "u"}, {KEY_I, "i"}, {KEY_O, "o"}, {KEY_P, "p"},
        {KEY_LEFTBRACE, "["}, {KEY_RIGHTBRACE, "]"}, {KEY_ENTER, "enter"},
        {KEY_A, "a"}, {KEY_S, "s"}, {KEY_D, "d"}, {KEY_F, "f"}, {KEY_G, "g"},
        {KEY_H, "h"}, {KEY_J, "j"}, {KEY_K, "k"}, {KEY_L, "l"},
        {KEY_SEMICOLON, ";"}, {KEY_APOSTROPHE, "'"}, {KEY_GRAVE, "`"},
        {KEY_BACKSLASH, "\\"},
        {KEY_Z, "z"}, {KEY_X, "x"}, {KEY_C, "c"}, {KEY_V, "v"}, {KEY_B, "b"},
        {KEY_N, "n"}, {KEY_M, "m"}, {KEY_COMMA, ","}, {KEY_DOT, "."}, {KEY_SLASH, "/"},
        {KEY_SPACE, "space"}, {KEY_CAPSLOCK, "caps_lock"},
        {KEY_F1, "f1"}, {KEY_F2, "f2"}, {KEY_F3, "f3"}, {KEY_F4, "f4"},
        {KEY_F5, "f5"}, {KEY_F6, "f6"}, {KEY_F7, "f7"}, {KEY_F8, "f8"},
        {KEY_F9, "f9"}, {KEY_F10, "f10"}, {KEY_F11, "f11"}, {KEY_F12, "f12"},
        {KEY_HOME, "home"}, {KEY_END, "end"}, {KEY_PAGEUP, "page_up"},
        {KEY_PAGEDOWN, "page_down"}, {KEY_UP, "up"}, {KEY_DOWN, "down"},
        {KEY_LEFT, "left"}, {KEY_RIGHT, "right"}, {KEY_INSERT, "insert"},
        {KEY_DELETE, "delete"},
        // Modifiers: left and right collapse to one logical key
        {KEY_LEFTMETA, "cmd"}, {KEY_RIGHTMETA, "cmd"},
        {KEY_LEFTCTRL, "ctrl"}, {KEY_RIGHTCTRL, "ctrl"},
        {KEY_LEFTALT, "alt"}, {KEY_RIGHTALT, "alt"},
        {KEY_LEFTSHIFT, "shift"}, {KEY_RIGHTSHIFT, "shift"},
    };
    return table;
}

// Declared symbolic names (already lower-cased) -> logical id
const std::unordered_map<std::string, const char*>& name_table() {
    static const std::unordered_map<std::string, const char*> table = {
        {"cmd", "cmd"}, {"cmd_l", "cmd"}, {"cmd_r", "cmd"},
        {"command", "cmd"}, {"super", "cmd"}, {"super_l", "cmd"}, {"super_r", "cmd"},
        {"meta", "cmd"}, {"win", "cmd"},
        {"ctrl", "ctrl"}, {"ctrl_l", "ctrl"}, {"ctrl_r", "ctrl"}, {"control", "ctrl"},
        {"alt", "alt"}, {"alt_l", "alt"}, {"alt_r", "alt"}, {"alt_gr", "alt"},
        {"option", "alt"}, {"opt", "alt"},
        {"shift", "shift"}, {"shift_l", "shift"}, {"shift_r", "shift"},
        {"space", "space"}, {"enter", "enter"}, {"return", "enter"},
        {"tab", "tab"}, {"esc", "esc"}, {"escape", "esc"},
        {"backspace", "backspace"}, {"delete", "delete"}, {"insert", "insert"},
        {"caps_lock", "caps_lock"},
        {"up", "up"}, {"down", "down"}, {"left", "left"}, {"right", "right"},
        {"home", "home"}, {"end", "end"}, {"page_up", "page_up"}, {"page_down", "page_down"},
        {"f1", "f1"}, {"f2", "f2"}, {"f3", "f3"}, {"f4", "f4"}, {"f5", "f5"},
        {"f6", "f6"}, {"f7", "f7"}, {"f8", "f8"}, {"f9", "f9"}, {"f10", "f10"},
        {"f11", "f11"}, {"f12", "f12"},
        {"minus", "-"}, {"equal", "="}, {"comma", ","}, {"period", "."}, {"dot", "."},
        {"slash", "/"}, {"backslash", "\\"}, {"semicolon", ";"}, {"apostrophe", "'"},
        {"grave", "`"}, {"bracketleft", "["}, {"bracketright", "]"},
    };
    return table;
}

// Layout correction: characters produced by non-Latin layouts (and shifted
// US symbols) -> the QWERTY key in the same physical position.
const std::unordered_map<char32_t, const char*>& layout_table() {
    static const std::unordered_map<char32_t, const char*> table = {
        // Russian ЙЦУКЕН
        {U'й', "q"}, {U'ц', "w"}, {U'у', "e"}, {U'к', "r"}, {U'е', "t"},
        {U'н', "y"}, {U'г', "u"}, {U'ш', "i"}, {U'щ', "o"}, {U'з', "p"},
        {U'х', "["}, {U'ъ', "]"},
        {U'ф', "a"}, {U'ы', "s"}, {U'в', "d"}, {U'а', "f"}, {U'п', "g"},
        {U'р', "h"}, {U'о', "j"}, {U'л', "k"}, {U'д', "l"}, {U'ж', ";"}, {U'э', "'"},
        {U'я', "z"}, {U'ч', "x"}, {U'с', "c"}, {U'м', "v"}, {U'и', "b"},
        {U'т', "n"}, {U'ь', "m"}, {U'б', ","}, {U'ю', "."}, {U'ё', "`"},
        // Ukrainian letters that differ from Russian
        {U'і', "s"}, {U'ї', "]"}, {U'є', "'"}, {U'ґ', "\\"},
        // Shifted US symbols
        {U'!', "1"}, {U'@', "2"}, {U'#', "3"}, {U'$', "4"}, {U'%', "5"},
        {U'^', "6"}, {U'&', "7"}, {U'*', "8"}, {U'(', "9"}, {U')', "0"},
        {U'_', "-"}, {U'+', "="}, {U'{', "["}, {U'}', "]"}, {U'|', "\\"},
        {U':', ";"}, {U'"', "'"}, {U'<', ","}, {U'>', "."}, {U'?', "/"},
        {U'~', "`"}, {U' ', "space"},
    };
    return table;
}

std::string to_lower_ascii(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

KeyEvent KeyResolver::classify(const RawKeyEvent& raw) {
    if (raw.code >= 0 && !from_physical_code(static_cast<uint32_t>(raw.code)).is_unknown()) {
        return KeyEvent::physical(static_cast<uint32_t>(raw.code));
    }
    if (!raw.name.empty() && !from_name(raw.name).is_unknown()) {
        return KeyEvent::named(to_lower_ascii(raw.name));
    }
    if (!raw.utf8.empty() && !from_character(raw.utf8).is_unknown()) {
        return KeyEvent::character(raw.utf8);
    }
    return KeyEvent::unresolved();
}

LogicalKey KeyResolver::resolve(const RawKeyEvent& raw) {
    return resolve(classify(raw));
}

LogicalKey KeyResolver::resolve(const KeyEvent& event) {
    switch (event.kind) {
        case KeyEventKind::PhysicalCode:
            return from_physical_code(event.code);
        case KeyEventKind::NamedKey:
            return from_name(event.text);
        case KeyEventKind::Character:
            return from_character(event.text);
        case KeyEventKind::Unresolved:
            break;
    }
    return LogicalKey();
}

bool KeyResolver::matches(const RawKeyEvent& raw, const LogicalKey& key) {
    if (key.is_unknown()) return false;

    if (raw.code >= 0) {
        LogicalKey physical = from_physical_code(static_cast<uint32_t>(raw.code));
        if (!physical.is_unknown()) return physical == key;
    }
    if (!raw.utf8.empty()) {
        LogicalKey produced = from_character(raw.utf8);
        if (!produced.is_unknown()) return produced == key;
    }
    if (!raw.name.empty()) {
        LogicalKey named = from_name(raw.name);
        if (!named.is_unknown()) return named == key;
    }
    return false;
}

LogicalKey KeyResolver::from_physical_code(uint32_t code) {
    const auto& table = physical_table();
    auto it = table.find(code);
    if (it == table.end()) return LogicalKey();
    return LogicalKey(it->second);
}

LogicalKey KeyResolver::from_name(const std::string& name) {
    if (name.empty()) return LogicalKey();

    const auto& table = name_table();
    auto it = table.find(to_lower_ascii(name));
    if (it == table.end()) return LogicalKey();
    return LogicalKey(it->second);
}

LogicalKey KeyResolver::from_character(const std::string& utf8) {
    std::u32string decoded;
    if (!decode_utf8(utf8, decoded) || decoded.size() != 1) {
        return LogicalKey();
    }

    char32_t cp = fold_case(decoded[0]);

    // Control characters carry no key identity
    if (cp < 0x20 || cp == 0x7F) return LogicalKey();

    const auto& table = layout_table();
    auto it = table.find(cp);
    if (it != table.end()) return LogicalKey(it->second);

    std::string id;
    append_utf8(cp, id);
    return LogicalKey(id);
}

LogicalKey KeyResolver::key_from_name(const std::string& token) {
    LogicalKey named = from_name(token);
    if (!named.is_unknown()) return named;
    return from_character(token);
}

bool KeyResolver::modifier_of(const LogicalKey& key, Modifier& out) {
    if (key.is_unknown()) return false;

    const std::string& id = key.id();
    if (id == "cmd") { out = Modifier::Cmd; return true; }
    if (id == "ctrl") { out = Modifier::Ctrl; return true; }
    if (id == "alt") { out = Modifier::Alt; return true; }
    if (id == "shift") { out = Modifier::Shift; return true; }
    return false;
}

} // namespace pushscribe
