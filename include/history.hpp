#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace pushscribe {

struct HistoryEntry {
    std::string text;
    std::string action_id;
    std::chrono::system_clock::time_point timestamp;
};

// Most-recent-first list of inserted transcripts, bounded in size
class DictationHistory {
public:
    explicit DictationHistory(size_t max_entries = 20);

    void add(const std::string& text, const std::string& action_id);

    // Up to `count` newest entries, newest first
    std::vector<HistoryEntry> recent(size_t count) const;

    void clear();
    size_t size() const;

    void set_max_entries(size_t max_entries);
    size_t max_entries() const;

private:
    void trim_locked();

    mutable std::mutex mutex_;
    std::deque<HistoryEntry> entries_;
    size_t max_entries_;
};

} // namespace pushscribe
