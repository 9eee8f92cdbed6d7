#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pushscribe {

// Removes spoken filler words ("um", "uh", "ээ", "типа", "äh", "euh" ...)
// from a transcript, then normalizes spacing and capitalization.
//
// Works on whitespace-separated words. Sentence punctuation attached to a
// removed filler moves to the previous word; commas go with the filler.
// "like", "so" and "bueno" only count as fillers when a comma follows them.
class FillerFilter {
public:
    FillerFilter();

    std::string process(const std::string& text) const;

    // True if `word` (without punctuation, any case) is a filler on its own.
    // Public for testing.
    bool is_filler(const std::string& word) const;

    // Additional single-word filler, matched case-insensitively
    void add_filler(const std::string& word);

private:
    struct RepeatPattern {
        std::u32string stem;
        char32_t repeat;
    };

    bool is_filler_folded(const std::u32string& word) const;
    bool is_comma_filler(const std::u32string& word) const;

    std::vector<RepeatPattern> repeat_patterns_;
    std::vector<std::u32string> words_;
    std::vector<std::u32string> comma_words_;
    std::vector<std::pair<std::u32string, std::u32string>> phrases_;
};

} // namespace pushscribe
