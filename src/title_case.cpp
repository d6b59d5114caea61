#include "include/case_transform.hpp"
#include "include/utf8.hpp"

namespace duckdb {
namespace changecase {

// Words kept lowercase unless they start or end the title
static const char* const SMALL_WORDS[] = {
    "a", "ad", "an", "and", "as", "at", "because", "but", "by", "en", "for", "if", "in",
    "neither", "nor", "of", "on", "only", "or", "over", "per", "so", "some", "than", "that",
    "the", "to", "up", "upon", "v", "vs", "versus", "via", "when", "with", "without", "yet",
};

static bool is_space_codepoint(uint32_t codepoint) {
    switch (codepoint) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return codepoint >= 0x2000 && codepoint <= 0x200A;
    }
}

// Whitespace, colons, hyphens, en and em dashes stand alone between title tokens
static bool is_token_separator(uint32_t codepoint) {
    return is_space_codepoint(codepoint) || codepoint == ':' || codepoint == '-' || codepoint == 0x2013 ||
           codepoint == 0x2014;
}

static bool is_word_codepoint(uint32_t codepoint) {
    return codepoint == '_' || classify_codepoint(codepoint) != CharClass::DELIMITER;
}

static bool is_small_word(const std::string& word) {
    for (auto small_word : SMALL_WORDS) {
        if (word == small_word) {
            return true;
        }
    }
    return false;
}

static bool contains_small_word(const std::string& token) {
    std::string run;
    size_t pos = 0;
    while (pos < token.size()) {
        uint32_t codepoint;
        size_t length = utf8_decode(token, pos, codepoint);
        if (is_word_codepoint(codepoint)) {
            run.append(token, pos, length);
        } else {
            if (is_small_word(run)) {
                return true;
            }
            run.clear();
        }
        pos += length;
    }
    return is_small_word(run);
}

// "iPhone", "NASA" and "example.com" are left exactly as written
static bool is_manually_cased(const std::string& token) {
    size_t pos = 0;
    size_t index = 0;
    while (pos < token.size()) {
        uint32_t codepoint;
        size_t length = utf8_decode(token, pos, codepoint);
        if (index > 0) {
            if (codepoint >= 'A' && codepoint <= 'Z') {
                return true;
            }
            if (codepoint == '.' && pos + length < token.size()) {
                return true;
            }
        }
        pos += length;
        index++;
    }
    return false;
}

static bool is_title_letter(uint32_t codepoint) {
    return (codepoint >= 'A' && codepoint <= 'Z') || (codepoint >= 'a' && codepoint <= 'z') ||
           (codepoint >= '0' && codepoint <= '9') || (codepoint >= 0xC0 && codepoint <= 0xFF);
}

static std::string capitalize_first_letter(const std::string& token) {
    size_t pos = 0;
    while (pos < token.size()) {
        uint32_t codepoint;
        size_t length = utf8_decode(token, pos, codepoint);
        if (is_title_letter(codepoint)) {
            std::string result = token.substr(0, pos);
            if (!append_upper_case(result, codepoint)) {
                result.append(token, pos, length);
            }
            result.append(token, pos + length, std::string::npos);
            return result;
        }
        pos += length;
    }
    return token;
}

// A token directly followed by ':' and then a non-space is a URL scheme ("https://...")
static bool is_url_scheme(const std::string& input, size_t token_end) {
    if (token_end >= input.size() || input[token_end] != ':') {
        return false;
    }
    size_t after_colon = token_end + 1;
    if (after_colon >= input.size()) {
        return true;
    }
    uint32_t codepoint;
    utf8_decode(input, after_colon, codepoint);
    return !is_space_codepoint(codepoint);
}

static void append_title_token(const std::string& input, size_t start, size_t end, std::string& result) {
    std::string token = input.substr(start, end - start);
    bool at_edge = start == 0 || end == input.size();

    if (!is_manually_cased(token) && (at_edge || !contains_small_word(token)) && !is_url_scheme(input, end)) {
        result += capitalize_first_letter(token);
    } else {
        result += token;
    }
}

std::string to_title_case(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    size_t token_start = 0;
    size_t pos = 0;
    while (pos < input.size()) {
        uint32_t codepoint;
        size_t length = utf8_decode(input, pos, codepoint);
        if (is_token_separator(codepoint)) {
            if (pos > token_start) {
                append_title_token(input, token_start, pos, result);
            }
            result.append(input, pos, length);
            token_start = pos + length;
        }
        pos += length;
    }
    if (pos > token_start) {
        append_title_token(input, token_start, pos, result);
    }

    return result;
}

} // namespace changecase
} // namespace duckdb
