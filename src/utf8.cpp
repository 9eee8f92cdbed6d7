#include "utf8.hpp"

namespace pushscribe {

bool decode_utf8(const std::string& text, std::u32string& out) {
    out.clear();
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        int extra = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            return false;  // stray continuation byte or invalid lead
        }

        if (i + static_cast<size_t>(extra) >= text.size()) {
            return false;  // truncated sequence
        }

        for (int k = 1; k <= extra; ++k) {
            unsigned char c = static_cast<unsigned char>(text[i + k]);
            if ((c & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (c & 0x3F);
        }

        // Reject overlong encodings, surrogates and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }

        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }

    return true;
}

void append_utf8(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        if (cp >= 0xD800 && cp <= 0xDFFF) return;
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        if ((lead & 0xE0) == 0xC0) extra = 1;
        else if ((lead & 0xF0) == 0xE0) extra = 2;
        else if ((lead & 0xF8) == 0xF0) extra = 3;

        // A well-formed sequence is one code point; anything else is one per byte
        size_t step = 1;
        if (extra > 0 && i + extra < text.size()) {
            std::u32string decoded;
            if (decode_utf8(text.substr(i, extra + 1), decoded)) {
                step = extra + 1;
            }
        }
        ++count;
        i += step;
    }
    return count;
}

namespace {

// Latin Extended-A pairs (U+0100..U+017F). Returns 0 for no mapping.
char32_t latin_ext_a_lower(char32_t cp) {
    if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
        (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x0178) return 0x00FF;  // Ÿ
    return 0;
}

char32_t latin_ext_a_upper(char32_t cp) {
    if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
        (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 1) ? cp - 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 0) ? cp - 1 : cp;
    }
    if (cp == 0x00FF) return 0x0178;  // ÿ
    return 0;
}

} // namespace

char32_t fold_case(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;   // Latin-1
    if (char32_t lower = latin_ext_a_lower(cp)) return lower;
    // Greek
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp == 0x0386) return 0x03AC;                                 // Ά
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;             // Έ Ή Ί
    if (cp == 0x038C) return 0x03CC;                                 // Ό
    if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;              // Ύ Ώ
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;             // А-Я
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;             // Ё, Є, І, Ї ...
    if (cp == 0x0490) return 0x0491;                                 // Ґ
    return cp;
}

char32_t upper_case(char32_t cp) {
    if (cp >= 'a' && cp <= 'z') return cp - 0x20;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (char32_t upper = latin_ext_a_upper(cp)) return upper;
    if (cp >= 0x03B1 && cp <= 0x03C9) return cp == 0x03C2 ? 0x03A3 : cp - 0x20;  // ς -> Σ
    if (cp == 0x03AC) return 0x0386;
    if (cp >= 0x03AD && cp <= 0x03AF) return cp - 0x25;
    if (cp == 0x03CC) return 0x038C;
    if (cp == 0x03CD || cp == 0x03CE) return cp - 0x3F;
    if (cp >= 0x0430 && cp <= 0x044F) return cp - 0x20;
    if (cp >= 0x0450 && cp <= 0x045F) return cp - 0x50;
    if (cp == 0x0491) return 0x0490;
    return cp;
}

} // namespace pushscribe
