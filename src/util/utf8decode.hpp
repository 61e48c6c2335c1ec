#pragma once

// UTF-8 helpers. Columns throughout the library count code points, so every
// component that maps between bytes and columns goes through these.

#include <cstdint>
#include <string>

namespace yamlview {

const char32_t kReplacementCharacter = 0xFFFD;

// Decode the code point starting at `*offset` and advance past it.
// Malformed or truncated sequences decode as U+FFFD and consume one byte.
char32_t
utf8_next(const std::string& s, std::string::size_type* offset);

// Count code points inside given range.
int64_t
utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end);

// Count code points contained in a std::string
int64_t
utf8_len(const std::string& s);

// Byte offset of the code point `index` steps after `start`. Clamps at the end
// of the string.
std::string::size_type
utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t index);

std::u32string
utf8_decode(const std::string& s);

void
utf8_append(std::string& out, char32_t codepoint);

std::string
utf8_encode(const std::u32string& s);

}  // namespace yamlview
