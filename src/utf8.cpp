#include "include/utf8.hpp"

namespace duckdb {
namespace changecase {

static const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;
static const uint32_t LATIN_CAPITAL_Y_WITH_DIAERESIS = 0x178;
static const uint32_t LATIN_SMALL_Y_WITH_DIAERESIS = 0xFF;
static const uint32_t LATIN_SMALL_SHARP_S = 0xDF;

// Smallest code point each sequence length may encode; anything below is an overlong form
static const uint32_t MIN_CODEPOINT_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
static const uint32_t MAX_CODEPOINT = 0x10FFFF;

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8_decode(const std::string& str, size_t pos, uint32_t& codepoint) {
    auto lead = static_cast<unsigned char>(str[pos]);
    size_t remaining = str.size() - pos;

    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    }

    size_t length;
    uint32_t value;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
    } else {
        codepoint = REPLACEMENT_CHARACTER;
        return 1;
    }

    if (remaining < length) {
        codepoint = REPLACEMENT_CHARACTER;
        return 1;
    }
    for (size_t i = 1; i < length; i++) {
        auto c = static_cast<unsigned char>(str[pos + i]);
        if (!is_continuation(c)) {
            codepoint = REPLACEMENT_CHARACTER;
            return 1;
        }
        value = (value << 6) | (c & 0x3F);
    }

    bool is_surrogate = value >= 0xD800 && value <= 0xDFFF;
    if (value < MIN_CODEPOINT_FOR_LENGTH[length] || is_surrogate || value > MAX_CODEPOINT) {
        codepoint = REPLACEMENT_CHARACTER;
        return 1;
    }
    codepoint = value;
    return length;
}

void utf8_append(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

CharClass classify_codepoint(uint32_t codepoint) {
    if (codepoint < 0x80) {
        if (codepoint >= 'A' && codepoint <= 'Z') return CharClass::UPPER;
        if (codepoint >= 'a' && codepoint <= 'z') return CharClass::LOWER;
        if (codepoint >= '0' && codepoint <= '9') return CharClass::DIGIT;
        return CharClass::DELIMITER;
    }

    // Latin-1 supplement: symbols and punctuation, except the ordinal indicators and micro sign
    if (codepoint < 0xC0) {
        if (codepoint == 0xAA || codepoint == 0xB5 || codepoint == 0xBA) {
            return CharClass::UNCASED_LETTER;
        }
        return CharClass::DELIMITER;
    }
    if (codepoint == 0xD7 || codepoint == 0xF7) {
        return CharClass::DELIMITER;
    }
    if (codepoint <= 0xDE) return CharClass::UPPER;
    if (codepoint <= 0xFF) return CharClass::LOWER;
    if (codepoint == LATIN_CAPITAL_Y_WITH_DIAERESIS) return CharClass::UPPER;

    // General punctuation (dashes, quotes, spaces) and CJK punctuation
    if (codepoint >= 0x2000 && codepoint <= 0x206F) return CharClass::DELIMITER;
    if (codepoint >= 0x3000 && codepoint <= 0x3003) return CharClass::DELIMITER;
    if (codepoint == 0xFEFF) return CharClass::DELIMITER;

    return CharClass::UNCASED_LETTER;
}

static uint32_t codepoint_to_upper(uint32_t codepoint) {
    if (codepoint >= 'a' && codepoint <= 'z') {
        return codepoint - ('a' - 'A');
    }
    if (codepoint == LATIN_SMALL_Y_WITH_DIAERESIS) {
        return LATIN_CAPITAL_Y_WITH_DIAERESIS;
    }
    if (codepoint >= 0xE0 && codepoint <= 0xFE && codepoint != 0xF7) {
        return codepoint - 0x20;
    }
    return codepoint;
}

static uint32_t codepoint_to_lower(uint32_t codepoint) {
    if (codepoint >= 'A' && codepoint <= 'Z') {
        return codepoint + ('a' - 'A');
    }
    if (codepoint == LATIN_CAPITAL_Y_WITH_DIAERESIS) {
        return LATIN_SMALL_Y_WITH_DIAERESIS;
    }
    if (codepoint >= 0xC0 && codepoint <= 0xDE && codepoint != 0xD7) {
        return codepoint + 0x20;
    }
    return codepoint;
}

bool append_upper_case(std::string& out, uint32_t codepoint) {
    if (codepoint == LATIN_SMALL_SHARP_S) {
        out += "SS";
        return true;
    }
    uint32_t upper = codepoint_to_upper(codepoint);
    if (upper == codepoint) {
        return false;
    }
    utf8_append(out, upper);
    return true;
}

bool append_lower_case(std::string& out, uint32_t codepoint) {
    uint32_t lower = codepoint_to_lower(codepoint);
    if (lower == codepoint) {
        return false;
    }
    utf8_append(out, lower);
    return true;
}

} // namespace changecase
} // namespace duckdb
