#pragma once

#include "utils.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace duckdb {
namespace changecase {

enum class WordCase : uint8_t {
    PRESERVE,
    LOWER,
    UPPER,
    CAPITAL
};

// A naming convention: per-word casing rules and the delimiter placed between words
struct CaseOptions {
    CaseOptions() : delimiter(" "), first_word(WordCase::LOWER), other_words(WordCase::LOWER), separate_numbers(false) {}
    CaseOptions(std::string delimiter_p, WordCase first_word_p, WordCase other_words_p)
        : delimiter(std::move(delimiter_p)), first_word(first_word_p), other_words(other_words_p),
          separate_numbers(false) {}

    std::string delimiter;
    WordCase first_word;
    WordCase other_words;
    SplitOptions split;
    // Insert "_" between two consecutive numeric words when the delimiter is empty,
    // so "1.2" becomes "1_2" instead of "12"
    bool separate_numbers;
};

std::string apply_word_case(const std::string& word, WordCase word_case);

// Parses "lower", "upper", "capital" or "preserve" (any casing)
bool try_parse_word_case(const std::string& name, WordCase& result);

// Tokenizes the input and re-joins the words according to the options
std::string change_case(const std::string& input, const CaseOptions& options);

// Case transformation functions
std::string to_camel_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_pascal_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_capital_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_snake_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_param_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_constant_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_dot_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_path_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_header_case(const std::string& input, const SplitOptions& split = SplitOptions());
std::string to_sentence_case(const std::string& input, const SplitOptions& split = SplitOptions());

// Capitalizes words in place, leaving small words, manually cased words, URLs and separators alone
std::string to_title_case(const std::string& input);

// Inverts the case of every letter, the string is not tokenized
std::string to_swap_case(const std::string& input);

typedef std::string (*CaseConverter)(const std::string& input, const SplitOptions& split);

struct CaseConvention {
    const char* name;
    CaseConverter convert;
    const char* example;
};

const std::vector<CaseConvention>& case_conventions();

// Accepts "snake", "snake_case", "SnakeCase", "kebab-case", ...; returns nullptr for unknown names
const CaseConvention* find_case_convention(const std::string& name);

// Comma separated convention names, for error messages
std::string case_convention_names();

} // namespace changecase
} // namespace duckdb
