#include "filler_filter.hpp"
#include "utf8.hpp"
#include <cctype>

namespace pushscribe {

namespace {

struct Word {
    std::string core;         // word without trailing punctuation
    std::string punctuation;  // trailing ",.!?;:" run
    std::u32string folded;    // lower-cased core, empty if not valid UTF-8
};

bool is_trailing_punct(char c) {
    return c == ',' || c == '.' || c == '!' || c == '?' || c == ';' || c == ':';
}

bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::u32string fold(const std::string& text) {
    std::u32string out;
    if (!decode_utf8(text, out)) return std::u32string();
    for (char32_t& cp : out) cp = fold_case(cp);
    return out;
}

std::u32string u32(const char* utf8) {
    std::u32string out;
    decode_utf8(utf8, out);
    return out;
}

std::vector<Word> split_words(const std::string& text) {
    std::vector<Word> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= text.size()) break;

        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        std::string token = text.substr(start, i - start);

        size_t cut = token.size();
        while (cut > 0 && is_trailing_punct(token[cut - 1])) --cut;

        Word word;
        word.core = token.substr(0, cut);
        word.punctuation = token.substr(cut);
        word.folded = fold(word.core);
        words.push_back(word);
    }
    return words;
}

bool ends_sentence(const std::string& punctuation) {
    for (char c : punctuation) {
        if (is_terminator(c)) return true;
    }
    return false;
}

std::string terminators_of(const std::string& punctuation) {
    std::string out;
    for (char c : punctuation) {
        if (is_terminator(c)) out += c;
    }
    return out;
}

std::string capitalize_first(const std::string& word) {
    std::u32string decoded;
    if (word.empty() || !decode_utf8(word, decoded) || decoded.empty()) return word;

    decoded[0] = upper_case(decoded[0]);
    std::string out;
    for (char32_t cp : decoded) append_utf8(cp, out);
    return out;
}

} // namespace

FillerFilter::FillerFilter() {
    // stem followed by one or more of `repeat`: "uh", "uhhh", "эээ", "хмм"
    repeat_patterns_ = {
        {u32("u"), U'h'},   {u32("u"), U'm'},   {u32("uh"), U'm'},
        {u32("a"), U'h'},   {u32("e"), U'r'},   {u32("h"), U'm'},
        {u32("e"), U'h'},   {u32("eu"), U'h'},
        {u32(""), U'э'},    {u32("х"), U'м'},   {u32("м"), U'м'},
        {u32("н"), U'у'},
    };

    words_ = {
        u32("вот"), u32("типа"), u32("короче"),
        u32("äh"), u32("ähm"), u32("öh"), u32("öhm"),
        u32("ben"), u32("genre"),
    };

    comma_words_ = {u32("like"), u32("so"), u32("bueno")};

    phrases_ = {
        {u32("you"), u32("know")},
        {u32("i"), u32("mean")},
        {u32("как"), u32("бы")},
    };
}

void FillerFilter::add_filler(const std::string& word) {
    std::u32string folded = fold(word);
    if (!folded.empty()) words_.push_back(folded);
}

bool FillerFilter::is_filler(const std::string& word) const {
    return is_filler_folded(fold(word));
}

bool FillerFilter::is_filler_folded(const std::u32string& word) const {
    if (word.empty()) return false;

    for (const auto& pattern : repeat_patterns_) {
        if (word.size() <= pattern.stem.size()) continue;
        if (word.compare(0, pattern.stem.size(), pattern.stem) != 0) continue;

        bool all_repeat = true;
        for (size_t i = pattern.stem.size(); i < word.size(); ++i) {
            if (word[i] != pattern.repeat) {
                all_repeat = false;
                break;
            }
        }
        if (all_repeat) return true;
    }

    for (const auto& filler : words_) {
        if (word == filler) return true;
    }
    return false;
}

bool FillerFilter::is_comma_filler(const std::u32string& word) const {
    for (const auto& filler : comma_words_) {
        if (word == filler) return true;
    }
    return false;
}

std::string FillerFilter::process(const std::string& text) const {
    if (text.empty()) return text;

    std::vector<Word> words = split_words(text);
    std::vector<Word> kept;
    kept.reserve(words.size());

    bool capitalize_next = false;

    auto drop = [&](const Word& removed) {
        bool sentence_start = kept.empty() || ends_sentence(kept.back().punctuation);
        std::string terminators = terminators_of(removed.punctuation);

        if (!terminators.empty() && !kept.empty()) {
            // "go, um." -> "go."
            Word& previous = kept.back();
            while (!previous.punctuation.empty() && previous.punctuation.back() == ',') {
                previous.punctuation.pop_back();
            }
            if (!ends_sentence(previous.punctuation)) {
                previous.punctuation += terminators;
            }
            capitalize_next = true;
        } else if (sentence_start) {
            capitalize_next = true;
        }
    };

    for (size_t i = 0; i < words.size(); ++i) {
        const Word& word = words[i];

        // Two-word phrases: "you know", "i mean", "как бы"
        if (i + 1 < words.size() && word.punctuation.empty()) {
            bool matched = false;
            for (const auto& phrase : phrases_) {
                if (word.folded == phrase.first && words[i + 1].folded == phrase.second) {
                    matched = true;
                    break;
                }
            }
            if (matched) {
                drop(words[i + 1]);
                ++i;
                continue;
            }
        }

        bool comma_follows = !word.punctuation.empty() && word.punctuation[0] == ',';
        if (is_filler_folded(word.folded) || (comma_follows && is_comma_filler(word.folded))) {
            drop(word);
            continue;
        }

        // Punctuation left dangling at the very start
        if (word.core.empty() && kept.empty()) continue;

        Word copy = word;
        if (capitalize_next && !copy.core.empty()) {
            copy.core = capitalize_first(copy.core);
        }
        capitalize_next = false;
        kept.push_back(copy);
    }

    std::string result;
    for (const auto& word : kept) {
        if (!result.empty()) result += ' ';
        result += word.core;
        result += word.punctuation;
    }

    // Always start with a capital
    return capitalize_first(result);
}

} // namespace pushscribe
