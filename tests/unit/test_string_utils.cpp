#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Rotor::Utils::Text;

TEST(TextTest, Trim) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TextTest, ToLower) {
    EXPECT_EQ(to_lower("WaRnInG"), "warning");
}

TEST(TextTest, StartsWith) {
    EXPECT_TRUE(starts_with("proxies.json", "proxies"));
    EXPECT_FALSE(starts_with("proxies.json", "json"));
    EXPECT_FALSE(starts_with("a", "abc"));
}

TEST(TextTest, ReplaceAll) {
    EXPECT_EQ(replace_all("{proxy} and {proxy}", "{proxy}", "1.2.3.4:80"),
              "1.2.3.4:80 and 1.2.3.4:80");
    EXPECT_EQ(replace_all("abc", "", "x"), "abc");
    // Replacement containing the pattern must not loop
    EXPECT_EQ(replace_all("aa", "a", "aa"), "aaaa");
}

TEST(TextTest, SanitizeName) {
    EXPECT_EQ(sanitize_name("Lecture 01: Intro"), "Lecture_01_Intro");
    EXPECT_EQ(sanitize_name("  spaced  "), "spaced");
    EXPECT_EQ(sanitize_name("a--b__c"), "a--b__c");
    EXPECT_EQ(sanitize_name("a / b"), "a_b");
    EXPECT_EQ(sanitize_name(""), "unnamed");
    EXPECT_EQ(sanitize_name("   "), "unnamed");
    EXPECT_EQ(sanitize_name("???"), "_");
}

TEST(TextTest, SanitizeNameTruncates) {
    std::string long_name(300, 'x');
    EXPECT_EQ(sanitize_name(long_name).size(), 120u);
    EXPECT_EQ(sanitize_name(long_name, 10), std::string(10, 'x'));
}

TEST(TextTest, SanitizeNameKeepsUnicodeLetters) {
    EXPECT_EQ(sanitize_name("Lezione città"), "Lezione_città");
    EXPECT_EQ(sanitize_name("Lezione cittò"), "Lezione_cittò");
    EXPECT_NE(sanitize_name("Lezione città"), sanitize_name("Lezione cittò"));
    EXPECT_EQ(sanitize_name("日本語"), "日本語");
    EXPECT_EQ(sanitize_name("Über / Straße"), "Über_Straße");
}

TEST(TextTest, SanitizeNameTruncatesOnCodePoints) {
    // "àà" is four bytes but two characters
    EXPECT_EQ(sanitize_name("àààà", 2), "àà");
    EXPECT_EQ(sanitize_name("aé日b", 3), "aé日");
}
