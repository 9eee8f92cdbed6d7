#pragma once

#include <string>
#include <cstddef>

namespace pushscribe {

// Decode UTF-8 into code points. Returns false on any malformed sequence
// (truncated, overlong, surrogate, out of range); `out` is then unspecified.
bool decode_utf8(const std::string& text, std::u32string& out);

// Append the UTF-8 encoding of `cp` to `out`. Invalid code points are skipped.
void append_utf8(char32_t cp, std::string& out);

// Number of code points in `text`. Each byte that is not part of a
// well-formed sequence (stray continuation, truncated or overlong lead)
// counts as one.
size_t utf8_length(const std::string& text);

// Simple case mapping for ASCII, Latin-1, Latin Extended-A, Greek and
// Cyrillic (incl. Ukrainian). Other code points are returned unchanged.
char32_t fold_case(char32_t cp);
char32_t upper_case(char32_t cp);

} // namespace pushscribe
