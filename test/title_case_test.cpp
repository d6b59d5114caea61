#include <gtest/gtest.h>

#include "case_transform.hpp"

namespace duckdb {
namespace changecase {

TEST(TestTitleCase, TestSimpleWords) {
    ASSERT_EQ("", to_title_case(""));
    ASSERT_EQ("2019", to_title_case("2019"));
    ASSERT_EQ("Test", to_title_case("test"));
    ASSERT_EQ("Two Words", to_title_case("two words"));
    ASSERT_EQ("One. Two.", to_title_case("one. two."));
}

TEST(TestTitleCase, TestSmallWords) {
    ASSERT_EQ("This vs That", to_title_case("this vs that"));
    ASSERT_EQ("This vs. That", to_title_case("this vs. that"));
    ASSERT_EQ("This v That", to_title_case("this v that"));
    ASSERT_EQ("This v. That", to_title_case("this v. that"));
    ASSERT_EQ("A Small Word Starts", to_title_case("a small word starts"));
    ASSERT_EQ("Small Word Ends On", to_title_case("small word ends on"));
    ASSERT_EQ("The Quick Brown Fox Jumps over the Lazy Dog",
              to_title_case("the quick brown fox jumps over the lazy dog"));
    ASSERT_EQ("Newcastle upon Tyne", to_title_case("newcastle upon tyne"));
    ASSERT_EQ("Newcastle *upon* Tyne", to_title_case("newcastle *upon* tyne"));
}

TEST(TestTitleCase, TestManualCase) {
    ASSERT_EQ("We Keep NASA Capitalized", to_title_case("we keep NASA capitalized"));
    ASSERT_EQ("Pass camelCase Through", to_title_case("pass camelCase through"));
    ASSERT_EQ("Leave Q&A Unscathed", to_title_case("leave Q&A unscathed"));
    ASSERT_EQ("Scott Moritz and TheStreet.com\xE2\x80\x99s Million iPhone La-La Land",
              to_title_case("Scott Moritz and TheStreet.com\xE2\x80\x99s million iPhone la-la land"));
}

TEST(TestTitleCase, TestSeparators) {
    ASSERT_EQ("Follow Step-by-Step Instructions", to_title_case("follow step-by-step instructions"));
    ASSERT_EQ("Start Title \xE2\x80\x93 End Title", to_title_case("start title \xE2\x80\x93 end title"));
    ASSERT_EQ("Start Title\xE2\x80\x93" "End Title", to_title_case("start title\xE2\x80\x93" "end title"));
    ASSERT_EQ("Start Title \xE2\x80\x94 End Title", to_title_case("start title \xE2\x80\x94 end title"));
    ASSERT_EQ("Start Title\xE2\x80\x94" "End Title", to_title_case("start title\xE2\x80\x94" "end title"));
    ASSERT_EQ("Start Title - End Title", to_title_case("start title - end title"));
    ASSERT_EQ("One: Two", to_title_case("one: two"));
    ASSERT_EQ("One Two: Three Four", to_title_case("one two: three four"));
    ASSERT_EQ("One Two: \"Three Four\"", to_title_case("one two: \"Three Four\""));
}

TEST(TestTitleCase, TestPunctuation) {
    ASSERT_EQ("Your Hair[cut] Looks (Nice)", to_title_case("your hair[cut] looks (nice)"));
    ASSERT_EQ("Don't Break", to_title_case("don't break"));
    ASSERT_EQ("\"Double Quotes\"", to_title_case("\"double quotes\""));
    ASSERT_EQ("Double Quotes \"Inner\" Word", to_title_case("double quotes \"inner\" word"));
    ASSERT_EQ("Fancy Double Quotes \xE2\x80\x9CInner\xE2\x80\x9D Word",
              to_title_case("fancy double quotes \xE2\x80\x9Cinner\xE2\x80\x9D word"));
    ASSERT_EQ("Have You Read \xE2\x80\x9CThe Lottery\xE2\x80\x9D?",
              to_title_case("have you read \xE2\x80\x9CThe Lottery\xE2\x80\x9D?"));
    ASSERT_EQ("_Underscores Around Words_", to_title_case("_underscores around words_"));
    ASSERT_EQ("*Asterisks Around Words*", to_title_case("*asterisks around words*"));
    ASSERT_EQ("Notes and Observations Regarding Apple\xE2\x80\x99s Announcements From "
              "\xE2\x80\x98The Beat Goes On\xE2\x80\x99 Special Event",
              to_title_case("Notes and observations regarding Apple\xE2\x80\x99s announcements from "
                            "\xE2\x80\x98The Beat Goes On\xE2\x80\x99 special event"));
}

TEST(TestTitleCase, TestUrlsAndEmails) {
    ASSERT_EQ("Email email@example.com Address", to_title_case("email email@example.com address"));
    ASSERT_EQ("You Have an https://example.com/ Title", to_title_case("you have an https://example.com/ title"));
}

TEST(TestTitleCase, TestLatin1Letters) {
    ASSERT_EQ("Pi\xC3\xB1" "a Colada While You Listen to \xC3\x86nima",
              to_title_case("pi\xC3\xB1" "a colada while you listen to \xC3\xA6nima"));
}

} // namespace changecase
} // namespace duckdb
