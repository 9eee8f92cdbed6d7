#include "history.hpp"

namespace pushscribe {

DictationHistory::DictationHistory(size_t max_entries)
    : max_entries_(max_entries) {
}

void DictationHistory::add(const std::string& text, const std::string& action_id) {
    if (text.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_front(HistoryEntry{text, action_id, std::chrono::system_clock::now()});
    trim_locked();
}

std::vector<HistoryEntry> DictationHistory::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = count < entries_.size() ? count : entries_.size();
    return std::vector<HistoryEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(n));
}

void DictationHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t DictationHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DictationHistory::set_max_entries(size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = max_entries;
    trim_locked();
}

size_t DictationHistory::max_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_entries_;
}

void DictationHistory::trim_locked() {
    while (entries_.size() > max_entries_) {
        entries_.pop_back();
    }
}

} // namespace pushscribe
