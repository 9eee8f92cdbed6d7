#include "console_tray.hpp"
#include <iostream>

// Linux tray implementation - basic version without GUI dependencies.
// A real tray icon would need GTK or Qt.

namespace pushscribe {

void ConsoleTray::on_status(AppState state, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[pushscribe] " << message << " (" << app_state_name(state) << ")" << std::endl;
}

void ConsoleTray::on_alert(const std::string& title, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[pushscribe] " << title << ": " << message << std::endl;
}

void ConsoleTray::on_history_changed(const std::vector<HistoryEntry>& recent) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recent.empty()) return;

    std::cout << "[pushscribe] History (" << recent.size() << "): \""
              << recent.front().text << "\"" << std::endl;
}

} // namespace pushscribe
