#include "text_inserter.hpp"
#include <cstdio>
#include <iostream>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace pushscribe {

namespace {

bool pipe_to_command(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int ret = pclose(pipe);
    return ret == 0 && written == text.size();
}

void tap_key(Display* display, KeyCode keycode) {
    XTestFakeKeyEvent(display, keycode, True, 0);
    XFlush(display);
    XTestFakeKeyEvent(display, keycode, False, 0);
    XFlush(display);
}

} // namespace

bool X11TextInserter::set_clipboard(const std::string& text) {
    // First try xclip, then xsel
    if (pipe_to_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (pipe_to_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

bool X11TextInserter::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    // Ctrl+V
    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XFlush(display);
    tap_key(display, v_keycode);
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    XCloseDisplay(display);
    return true;
}

bool X11TextInserter::insert(const std::string& text) {
    if (text.empty()) return true;
    if (!set_clipboard(text)) return false;
    return paste();
}

bool X11TextInserter::delete_backward(size_t count) {
    if (count == 0) return true;

    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    KeyCode backspace = XKeysymToKeycode(display, XK_BackSpace);
    if (backspace == 0) {
        std::cerr << "Failed to get BackSpace keycode" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    for (size_t i = 0; i < count; ++i) {
        tap_key(display, backspace);
    }

    XCloseDisplay(display);
    return true;
}

} // namespace pushscribe
