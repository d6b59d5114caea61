#include "include/case_transform.hpp"
#include "include/utils.hpp"
#include <cctype>
#include <utility>

namespace duckdb {
namespace changecase {

std::string apply_word_case(const std::string& word, WordCase word_case) {
    switch (word_case) {
    case WordCase::LOWER:
        return to_lower(word);
    case WordCase::UPPER:
        return to_upper(word);
    case WordCase::CAPITAL:
        return capitalize(word);
    default:
        return word;
    }
}

bool try_parse_word_case(const std::string& name, WordCase& result) {
    auto key = to_lower(name);
    if (key == "lower") {
        result = WordCase::LOWER;
    } else if (key == "upper") {
        result = WordCase::UPPER;
    } else if (key == "capital") {
        result = WordCase::CAPITAL;
    } else if (key == "preserve") {
        result = WordCase::PRESERVE;
    } else {
        return false;
    }
    return true;
}

static bool is_digit_byte(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string change_case(const std::string& input, const CaseOptions& options) {
    auto words = split_words(input, options.split);

    std::string result;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) {
            if (options.separate_numbers && options.delimiter.empty() &&
                is_digit_byte(words[i - 1].back()) && is_digit_byte(words[i].front())) {
                result += '_';
            }
            result += options.delimiter;
        }
        result += apply_word_case(words[i], i == 0 ? options.first_word : options.other_words);
    }
    return result;
}

static CaseOptions with_split(CaseOptions options, const SplitOptions& split) {
    options.split = split;
    return options;
}

std::string to_camel_case(const std::string& input, const SplitOptions& split) {
    auto options = with_split(CaseOptions("", WordCase::LOWER, WordCase::CAPITAL), split);
    options.separate_numbers = true;
    return change_case(input, options);
}

std::string to_pascal_case(const std::string& input, const SplitOptions& split) {
    auto options = with_split(CaseOptions("", WordCase::CAPITAL, WordCase::CAPITAL), split);
    options.separate_numbers = true;
    return change_case(input, options);
}

std::string to_capital_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions(" ", WordCase::CAPITAL, WordCase::CAPITAL), split));
}

std::string to_snake_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions("_", WordCase::LOWER, WordCase::LOWER), split));
}

std::string to_param_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions("-", WordCase::LOWER, WordCase::LOWER), split));
}

std::string to_constant_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions("_", WordCase::UPPER, WordCase::UPPER), split));
}

std::string to_dot_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions(".", WordCase::LOWER, WordCase::LOWER), split));
}

std::string to_path_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions("/", WordCase::LOWER, WordCase::LOWER), split));
}

std::string to_header_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions("-", WordCase::CAPITAL, WordCase::CAPITAL), split));
}

std::string to_sentence_case(const std::string& input, const SplitOptions& split) {
    return change_case(input, with_split(CaseOptions(" ", WordCase::CAPITAL, WordCase::LOWER), split));
}

std::string to_swap_case(const std::string& input) {
    return swap_case_chars(input);
}

// Title and swap case keep the input's separators, so split options do not apply
static std::string convert_title_case(const std::string& input, const SplitOptions&) {
    return to_title_case(input);
}

static std::string convert_swap_case(const std::string& input, const SplitOptions&) {
    return to_swap_case(input);
}

const std::vector<CaseConvention>& case_conventions() {
    static const std::vector<CaseConvention> conventions = {
        {"camel", to_camel_case, "testString"},
        {"pascal", to_pascal_case, "TestString"},
        {"capital", to_capital_case, "Test String"},
        {"snake", to_snake_case, "test_string"},
        {"param", to_param_case, "test-string"},
        {"constant", to_constant_case, "TEST_STRING"},
        {"dot", to_dot_case, "test.string"},
        {"path", to_path_case, "test/string"},
        {"header", to_header_case, "Test-String"},
        {"sentence", to_sentence_case, "Test string"},
        {"title", convert_title_case, "Test String"},
        {"swap", convert_swap_case, "TEST STRING"},
    };
    return conventions;
}

static const std::pair<const char*, const char*> CONVENTION_ALIASES[] = {
    {"kebab", "param"},
    {"const", "constant"},
    {"uppersnake", "constant"},
    {"screamingsnake", "constant"},
    {"lowersnake", "snake"},
    {"train", "header"},
};

static std::string normalize_convention_name(const std::string& name) {
    auto key = to_lower(join_strings(split_words(name), ""));
    static const std::string suffix = "case";
    if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
        key.erase(key.size() - suffix.size());
    }
    for (const auto& alias : CONVENTION_ALIASES) {
        if (key == alias.first) {
            return alias.second;
        }
    }
    return key;
}

const CaseConvention* find_case_convention(const std::string& name) {
    auto key = normalize_convention_name(name);
    for (const auto& convention : case_conventions()) {
        if (key == convention.name) {
            return &convention;
        }
    }
    return nullptr;
}

std::string case_convention_names() {
    std::vector<std::string> names;
    for (const auto& convention : case_conventions()) {
        names.push_back(convention.name);
    }
    return join_strings(names, ", ");
}

} // namespace changecase
} // namespace duckdb
