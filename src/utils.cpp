#include "include/utils.hpp"
#include "include/utf8.hpp"
#include <sstream>

namespace duckdb {
namespace changecase {

typedef bool (*CaseMapping)(std::string& out, uint32_t codepoint);

// Applies the mapping to at most max_chars code points, copying the remainder untouched
static std::string map_codepoints(const std::string& str, CaseMapping mapping, size_t max_chars) {
    std::string result;
    result.reserve(str.size());

    size_t pos = 0;
    size_t mapped = 0;
    while (pos < str.size()) {
        if (mapped == max_chars) {
            result.append(str, pos, std::string::npos);
            break;
        }
        uint32_t codepoint;
        size_t length = utf8_decode(str, pos, codepoint);
        if (!mapping(result, codepoint)) {
            result.append(str, pos, length);
        }
        pos += length;
        mapped++;
    }
    return result;
}

static bool append_swapped_case(std::string& out, uint32_t codepoint) {
    switch (classify_codepoint(codepoint)) {
    case CharClass::UPPER:
        return append_lower_case(out, codepoint);
    case CharClass::LOWER:
        return append_upper_case(out, codepoint);
    default:
        return false;
    }
}

std::string to_lower(const std::string& str) {
    return map_codepoints(str, append_lower_case, std::string::npos);
}

std::string to_upper(const std::string& str) {
    return map_codepoints(str, append_upper_case, std::string::npos);
}

std::string upper_case_first(const std::string& str) {
    return map_codepoints(str, append_upper_case, 1);
}

std::string lower_case_first(const std::string& str) {
    return map_codepoints(str, append_lower_case, 1);
}

std::string capitalize(const std::string& str) {
    return upper_case_first(to_lower(str));
}

std::string swap_case_chars(const std::string& str) {
    return map_codepoints(str, append_swapped_case, std::string::npos);
}

static bool is_letter_class(CharClass cls) {
    return cls == CharClass::UPPER || cls == CharClass::LOWER || cls == CharClass::UNCASED_LETTER;
}

static bool starts_new_word(CharClass last, CharClass current, CharClass next, const SplitOptions& options) {
    switch (current) {
    case CharClass::UPPER:
        // "camelCase", "v2Beta" and the last capital of an acronym: "XMLParser" -> "XML", "Parser"
        if (last == CharClass::LOWER || last == CharClass::DIGIT) {
            return true;
        }
        return last == CharClass::UPPER && next == CharClass::LOWER;
    case CharClass::LOWER:
    case CharClass::UNCASED_LETTER:
        return options.split_numbers && last == CharClass::DIGIT;
    case CharClass::DIGIT:
        return options.split_numbers && is_letter_class(last);
    default:
        return false;
    }
}

std::vector<std::string> split_words(const std::string& str, const SplitOptions& options) {
    std::vector<std::string> words;
    std::string current_word;
    CharClass last = CharClass::DELIMITER;

    size_t pos = 0;
    uint32_t codepoint;
    size_t length = str.empty() ? 0 : utf8_decode(str, 0, codepoint);

    while (pos < str.size()) {
        CharClass current = classify_codepoint(codepoint);
        size_t next_pos = pos + length;

        // Look ahead one code point for the acronym rule
        uint32_t next_codepoint = 0;
        size_t next_length = 0;
        CharClass next = CharClass::DELIMITER;
        if (next_pos < str.size()) {
            next_length = utf8_decode(str, next_pos, next_codepoint);
            next = classify_codepoint(next_codepoint);
        }

        if (current == CharClass::DELIMITER) {
            if (!current_word.empty()) {
                words.push_back(current_word);
                current_word.clear();
            }
        } else {
            if (!current_word.empty() && starts_new_word(last, current, next, options)) {
                words.push_back(current_word);
                current_word.clear();
            }
            current_word.append(str, pos, length);
        }

        last = current;
        pos = next_pos;
        codepoint = next_codepoint;
        length = next_length;
    }

    if (!current_word.empty()) {
        words.push_back(current_word);
    }

    return words;
}

std::string join_strings(const std::vector<std::string>& strings, const std::string& separator) {
    if (strings.empty()) return "";

    std::ostringstream result;
    result << strings[0];

    for (size_t i = 1; i < strings.size(); i++) {
        result << separator << strings[i];
    }

    return result.str();
}

} // namespace changecase
} // namespace duckdb
