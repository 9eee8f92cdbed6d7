#include "stream_reconciler.hpp"
#include "utf8.hpp"

namespace pushscribe {

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           text.compare(0, prefix.size(), prefix) == 0;
}

std::string trim_leading_whitespace(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return text.substr(start);
}

} // namespace

StreamEdit reconcile(const std::string& new_text, const std::string& last_committed) {
    StreamEdit edit;

    if (starts_with(new_text, last_committed)) {
        std::string suffix = trim_leading_whitespace(new_text.substr(last_committed.size()));
        if (!suffix.empty()) {
            edit.insert_text = suffix + " ";
        }
        return edit;
    }

    edit.delete_count = utf8_length(last_committed) + 1;
    if (!new_text.empty()) {
        edit.insert_text = new_text + " ";
    }
    return edit;
}

StreamEdit StreamReconciler::update(const std::string& new_text) {
    StreamEdit edit = reconcile(new_text, last_committed_);
    if (!edit.empty()) {
        last_committed_ = new_text;
    }
    return edit;
}

} // namespace pushscribe
