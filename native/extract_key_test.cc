#include "extract_key.hh"

#include "gtest/gtest.h"

TEST(ExtractKeyTest, LongestToken) {
    EXPECT_EQ(extract_key("a house"), "house");
    EXPECT_EQ(extract_key("der Lauf"), "lauf");
    EXPECT_EQ(extract_key("laufen"), "laufen");
}

TEST(ExtractKeyTest, TiesGoToFirstToken) {
    EXPECT_EQ(extract_key("to go"), "to");
    EXPECT_EQ(extract_key("to go (away) [coll.]"), "to");
    EXPECT_EQ(extract_key("abc def"), "abc");
}

TEST(ExtractKeyTest, Empty) {
    EXPECT_EQ(extract_key(""), "");
    EXPECT_EQ(extract_key("   "), "");
    EXPECT_EQ(extract_key("(only) [brackets]"), "");
    EXPECT_EQ(extract_key("{f} ..., <>"), "");
}

TEST(ExtractKeyTest, Lowercases) {
    EXPECT_EQ(extract_key("HOUSE"), "house");
    // Ärger {m}
    EXPECT_EQ(extract_key("\xC3\x84rger {m}"), "\xC3\xA4rger");
}

TEST(ExtractKeyTest, Punctuation) {
    EXPECT_EQ(extract_key("Mr. Smith, Jr."), "smith");
    EXPECT_EQ(extract_key("<to> a,b.cde"), "cde");
}

TEST(ExtractKeyTest, BracketsRemovedEverywhere) {
    EXPECT_EQ(extract_key("(verylongword) run [extraordinary] {something}"),
              "run");
    EXPECT_EQ(extract_key("(a) b (c) d"), "b");
}

TEST(ExtractKeyTest, NestedBracketsLoseOnlyTheInnerSpan) {
    // "x (a (b) c)" becomes "x (a  c)"
    EXPECT_EQ(extract_key("x (a (b) c)"), "(a");
    EXPECT_EQ(extract_key("(a (b) c) word"), "word");
}

TEST(ExtractKeyTest, LengthInCodePoints) {
    // "für" is three code points but four bytes
    EXPECT_EQ(extract_key("f\xC3\xBCr abc"), "f\xC3\xBCr");
    EXPECT_EQ(extract_key("abc f\xC3\xBCr"), "abc");
    EXPECT_EQ(extract_key("f\xC3\xBCr abcd"), "abcd");
}
