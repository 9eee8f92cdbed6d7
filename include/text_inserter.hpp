#pragma once

#include "interfaces.hpp"
#include <string>

namespace pushscribe {

// Inserts through the X11 clipboard (xclip or xsel) followed by a synthetic
// Ctrl+V, and deletes with synthetic BackSpace presses (XTest).
class X11TextInserter : public TextInserter {
public:
    bool insert(const std::string& text) override;
    bool delete_backward(size_t count) override;

    static bool set_clipboard(const std::string& text);
    static bool paste();
};

} // namespace pushscribe
