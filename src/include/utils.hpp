#pragma once

#include <string>
#include <vector>

namespace duckdb {
namespace changecase {

struct SplitOptions {
    SplitOptions() : split_numbers(true) {}
    explicit SplitOptions(bool split_numbers_p) : split_numbers(split_numbers_p) {}

    // Break words on letter/digit transitions ("version2" -> "version", "2")
    bool split_numbers;
};

// Case mapping (ASCII and Latin-1 letters, everything else is copied)
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::string upper_case_first(const std::string& str);
std::string lower_case_first(const std::string& str);
std::string capitalize(const std::string& str);
std::string swap_case_chars(const std::string& str);

// Word splitting and joining
std::vector<std::string> split_words(const std::string& str, const SplitOptions& options = SplitOptions());
std::string join_strings(const std::vector<std::string>& strings, const std::string& separator);

} // namespace changecase
} // namespace duckdb
