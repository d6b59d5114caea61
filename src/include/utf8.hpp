#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace duckdb {
namespace changecase {

// Character classes used by the word splitter
enum class CharClass : uint8_t {
    DELIMITER,
    UPPER,
    LOWER,
    DIGIT,
    UNCASED_LETTER
};

// Decodes the code point starting at str[pos] and returns its byte length.
// Malformed sequences (bad continuation bytes, overlong forms, surrogates and values
// above U+10FFFF) decode as U+FFFD with a length of one byte.
size_t utf8_decode(const std::string& str, size_t pos, uint32_t& codepoint);
void utf8_append(std::string& out, uint32_t codepoint);

CharClass classify_codepoint(uint32_t codepoint);

// Case mapping for ASCII and the Latin-1 supplement. Appends the mapped form and
// returns true, or appends nothing and returns false when the code point has none.
// The sharp s uppercases to "SS".
bool append_upper_case(std::string& out, uint32_t codepoint);
bool append_lower_case(std::string& out, uint32_t codepoint);

} // namespace changecase
} // namespace duckdb
