#pragma once

#include "interfaces.hpp"
#include <mutex>

namespace pushscribe {

// Status output for the console; there is no GUI tray on Linux
class ConsoleTray : public StatusListener {
public:
    void on_status(AppState state, const std::string& message) override;
    void on_alert(const std::string& title, const std::string& message) override;
    void on_history_changed(const std::vector<HistoryEntry>& recent) override;

private:
    // Keeps lines from different threads apart
    std::mutex mutex_;
};

} // namespace pushscribe
