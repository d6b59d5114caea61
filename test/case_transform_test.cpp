#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "case_transform.hpp"

using std::string;
using std::vector;

namespace duckdb {
namespace changecase {

TEST(TestCaseTransform, TestCamelCase) {
    ASSERT_EQ("", to_camel_case(""));
    ASSERT_EQ("test", to_camel_case("test"));
    ASSERT_EQ("testString", to_camel_case("test string"));
    ASSERT_EQ("testString", to_camel_case("Test String"));
    ASSERT_EQ("testV2", to_camel_case("TestV2"));
    ASSERT_EQ("fooBar", to_camel_case("_foo_bar_"));
    ASSERT_EQ("xmlHttpRequest", to_camel_case("XMLHttpRequest"));
    ASSERT_EQ("version1_2_10", to_camel_case("version 1.2.10"));
    ASSERT_EQ("version1_21_0", to_camel_case("version 1.21.0"));
}

TEST(TestCaseTransform, TestPascalCase) {
    ASSERT_EQ("", to_pascal_case(""));
    ASSERT_EQ("Test", to_pascal_case("test"));
    ASSERT_EQ("TestString", to_pascal_case("test string"));
    ASSERT_EQ("TestString", to_pascal_case("Test String"));
    ASSERT_EQ("TestV2", to_pascal_case("TestV2"));
    ASSERT_EQ("Version1_2_10", to_pascal_case("version 1.2.10"));
    ASSERT_EQ("Version1_21_0", to_pascal_case("version 1.21.0", SplitOptions(false)));
}

TEST(TestCaseTransform, TestCapitalCase) {
    ASSERT_EQ("", to_capital_case(""));
    ASSERT_EQ("Test", to_capital_case("test"));
    ASSERT_EQ("Test String", to_capital_case("test string"));
    ASSERT_EQ("Test String", to_capital_case("Test String"));
    ASSERT_EQ("Test V 2", to_capital_case("TestV2"));
    ASSERT_EQ("Test V2", to_capital_case("TestV2", SplitOptions(false)));
    ASSERT_EQ("Version 1 2 10", to_capital_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestSnakeCase) {
    ASSERT_EQ("", to_snake_case(""));
    ASSERT_EQ("id", to_snake_case("_id"));
    ASSERT_EQ("test", to_snake_case("test"));
    ASSERT_EQ("test_string", to_snake_case("test string"));
    ASSERT_EQ("test_string", to_snake_case("Test String"));
    ASSERT_EQ("xml_http_request", to_snake_case("XMLHttpRequest"));
    ASSERT_EQ("version_1_2_10", to_snake_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestParamCase) {
    ASSERT_EQ("", to_param_case(""));
    ASSERT_EQ("test-string", to_param_case("test string"));
    ASSERT_EQ("test-string", to_param_case("Test String"));
    ASSERT_EQ("test-v-2", to_param_case("TestV2"));
    ASSERT_EQ("test-v2", to_param_case("TestV2", SplitOptions(false)));
    ASSERT_EQ("version-1-21-0", to_param_case("version 1.21.0"));
}

TEST(TestCaseTransform, TestConstantCase) {
    ASSERT_EQ("", to_constant_case(""));
    ASSERT_EQ("TEST", to_constant_case("test"));
    ASSERT_EQ("TEST_STRING", to_constant_case("test string"));
    ASSERT_EQ("TEST_STRING", to_constant_case("Test String"));
    ASSERT_EQ("DOT_CASE", to_constant_case("dot.case"));
    ASSERT_EQ("PATH_CASE", to_constant_case("path/case"));
    ASSERT_EQ("TEST_V2", to_constant_case("TestV2", SplitOptions(false)));
    ASSERT_EQ("VERSION_1_2_10", to_constant_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestDotCase) {
    ASSERT_EQ("", to_dot_case(""));
    ASSERT_EQ("test.string", to_dot_case("test string"));
    ASSERT_EQ("test.string", to_dot_case("Test String"));
    ASSERT_EQ("dot.case", to_dot_case("dot.case"));
    ASSERT_EQ("path.case", to_dot_case("path/case"));
    ASSERT_EQ("version.1.2.10", to_dot_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestPathCase) {
    ASSERT_EQ("", to_path_case(""));
    ASSERT_EQ("test/string", to_path_case("test string"));
    ASSERT_EQ("test/string", to_path_case("Test String"));
    ASSERT_EQ("version/1/2/10", to_path_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestHeaderCase) {
    ASSERT_EQ("", to_header_case(""));
    ASSERT_EQ("Test", to_header_case("test"));
    ASSERT_EQ("Test-String", to_header_case("test string"));
    ASSERT_EQ("Test-String", to_header_case("Test String"));
    ASSERT_EQ("Content-Type", to_header_case("CONTENT_TYPE"));
    ASSERT_EQ("Version-1-21-0", to_header_case("version 1.21.0"));
}

TEST(TestCaseTransform, TestSentenceCase) {
    ASSERT_EQ("", to_sentence_case(""));
    ASSERT_EQ("Test", to_sentence_case("test"));
    ASSERT_EQ("Test string", to_sentence_case("test string"));
    ASSERT_EQ("Test string", to_sentence_case("Test String"));
    ASSERT_EQ("Test v2", to_sentence_case("TestV2", SplitOptions(false)));
    ASSERT_EQ("Version 1 2 10", to_sentence_case("version 1.2.10"));
}

TEST(TestCaseTransform, TestSwapCase) {
    ASSERT_EQ("", to_swap_case(""));
    ASSERT_EQ("TEST", to_swap_case("test"));
    ASSERT_EQ("TEST STRING", to_swap_case("test string"));
    ASSERT_EQ("tEST sTRING", to_swap_case("Test String"));
    ASSERT_EQ("tESTv2", to_swap_case("TestV2"));
    ASSERT_EQ("SwAp CaSe", to_swap_case("sWaP cAsE"));
    ASSERT_EQ("__X--y  Z__", to_swap_case("__x--Y  z__"));
}

TEST(TestCaseTransform, TestEveryConventionSplitsTheSameWords) {
    const vector<string> inputs = {"TestString", "test_string", "test-string", "test string"};
    for (const auto& input : inputs) {
        ASSERT_EQ(2u, split_words(input).size()) << input;
        ASSERT_EQ("test_string", to_snake_case(input)) << input;
        ASSERT_EQ("TestString", to_pascal_case(input)) << input;
    }
}

TEST(TestCaseTransform, TestIdempotence) {
    const vector<string> inputs = {
        "", "Test String", "XMLHttpRequest", "version 1.2.10", "TestV2", "_foo_bar_",
        "hello-world.example/path", "already_snake_case", "CONSTANT_VALUE", "stra\xC3\x9F" "eName",
        "gro\xC3\x9F name",
    };
    const vector<CaseConverter> converters = {
        to_snake_case, to_param_case, to_dot_case, to_path_case, to_constant_case, to_pascal_case, to_camel_case,
    };
    for (auto convert : converters) {
        for (const auto& input : inputs) {
            auto once = convert(input, SplitOptions());
            ASSERT_EQ(once, convert(once, SplitOptions())) << input;
        }
    }
}

TEST(TestCaseTransform, TestChangeCase) {
    ASSERT_EQ("camel case input", change_case("camelCase input", CaseOptions()));
    ASSERT_EQ("TEST :: STRING", change_case("TestString", CaseOptions(" :: ", WordCase::UPPER, WordCase::UPPER)));
    ASSERT_EQ("XML+Http+Request",
              change_case("XMLHttpRequest", CaseOptions("+", WordCase::PRESERVE, WordCase::PRESERVE)));
    ASSERT_EQ("Test_string", change_case("TEST STRING", CaseOptions("_", WordCase::CAPITAL, WordCase::LOWER)));
    ASSERT_EQ("", change_case("--", CaseOptions("_", WordCase::UPPER, WordCase::UPPER)));
}

TEST(TestCaseTransform, TestApplyWordCase) {
    ASSERT_EQ("word", apply_word_case("WoRd", WordCase::LOWER));
    ASSERT_EQ("WORD", apply_word_case("WoRd", WordCase::UPPER));
    ASSERT_EQ("Word", apply_word_case("wORD", WordCase::CAPITAL));
    ASSERT_EQ("WoRd", apply_word_case("WoRd", WordCase::PRESERVE));
}

TEST(TestCaseTransform, TestParseWordCase) {
    WordCase word_case;
    ASSERT_TRUE(try_parse_word_case("upper", word_case));
    ASSERT_EQ(WordCase::UPPER, word_case);
    ASSERT_TRUE(try_parse_word_case("Capital", word_case));
    ASSERT_EQ(WordCase::CAPITAL, word_case);
    ASSERT_TRUE(try_parse_word_case("PRESERVE", word_case));
    ASSERT_EQ(WordCase::PRESERVE, word_case);
    ASSERT_FALSE(try_parse_word_case("shout", word_case));
}

TEST(TestCaseConventions, TestFindByName) {
    ASSERT_STREQ("snake", find_case_convention("snake")->name);
    ASSERT_STREQ("snake", find_case_convention("snake_case")->name);
    ASSERT_STREQ("constant", find_case_convention("CONSTANT_CASE")->name);
    ASSERT_STREQ("camel", find_case_convention("camelCase")->name);
    ASSERT_STREQ("title", find_case_convention("Title Case")->name);
    ASSERT_STREQ("param", find_case_convention("kebab-case")->name);
    ASSERT_STREQ("header", find_case_convention("Train-Case")->name);
    ASSERT_STREQ("constant", find_case_convention("const")->name);
    ASSERT_STREQ("snake", find_case_convention("lower_snake")->name);
    ASSERT_STREQ("snake", find_case_convention("lower_snake_case")->name);
}

TEST(TestCaseTransform, TestSharpS) {
    ASSERT_EQ("Gro\xC3\x9FName", to_pascal_case("gro\xC3\x9F name"));
    ASSERT_EQ("Gro\xC3\x9FName", to_pascal_case("Gro\xC3\x9FName"));
    ASSERT_EQ("gro\xC3\x9FName", to_camel_case("gro\xC3\x9F name"));
    ASSERT_EQ("GROSS_NAME", to_constant_case("gro\xC3\x9F name"));
    ASSERT_EQ("gross_name", to_snake_case("GROSS_NAME"));
}

TEST(TestCaseConventions, TestUnknownName) {
    ASSERT_TRUE(find_case_convention("") == nullptr);
    ASSERT_TRUE(find_case_convention("case") == nullptr);
    ASSERT_TRUE(find_case_convention("shouting_case") == nullptr);
}

TEST(TestCaseConventions, TestExamples) {
    for (const auto& convention : case_conventions()) {
        ASSERT_EQ(convention.example, convention.convert("test string", SplitOptions())) << convention.name;
    }
    ASSERT_EQ("camel, pascal, capital, snake, param, constant, dot, path, header, sentence, title, swap",
              case_convention_names());
}

} // namespace changecase
} // namespace duckdb
