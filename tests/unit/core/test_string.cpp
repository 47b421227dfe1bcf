#include <gtest/gtest.h>
#include "inkwell/core/string.hpp"

#include <unordered_set>

using namespace inkwell;

// ============================================================================
// Unicode Tests
// ============================================================================

TEST(UnicodeTest, WordCharacters) {
    EXPECT_TRUE(unicode::is_word_character('a'));
    EXPECT_TRUE(unicode::is_word_character('Z'));
    EXPECT_TRUE(unicode::is_word_character('7'));
    EXPECT_TRUE(unicode::is_word_character('_'));
    EXPECT_FALSE(unicode::is_word_character('-'));
    EXPECT_FALSE(unicode::is_word_character(' '));
    EXPECT_FALSE(unicode::is_word_character(0x00E9));
}

TEST(UnicodeTest, Whitespace) {
    EXPECT_TRUE(unicode::is_ascii_whitespace(' '));
    EXPECT_TRUE(unicode::is_ascii_whitespace('\t'));
    EXPECT_TRUE(unicode::is_ascii_whitespace('\n'));
    EXPECT_TRUE(unicode::is_ascii_whitespace('\r'));
    EXPECT_FALSE(unicode::is_ascii_whitespace('x'));
}

TEST(UnicodeTest, Supplementary) {
    EXPECT_FALSE(unicode::is_supplementary('A'));
    EXPECT_FALSE(unicode::is_supplementary(0xFFFF));
    EXPECT_TRUE(unicode::is_supplementary(0x1F600));
}

TEST(UnicodeTest, Utf8DecodeAscii) {
    const char* text = "Hello";
    auto result = unicode::utf8_decode(text, 5);

    EXPECT_EQ(result.code_point, 'H');
    EXPECT_EQ(result.bytes_consumed, 1u);
}

TEST(UnicodeTest, Utf8DecodeTwoBytes) {
    const char* text = "\xC3\xA9";  // U+00E9
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(result.code_point, 0x00E9u);
    EXPECT_EQ(result.bytes_consumed, 2u);
}

TEST(UnicodeTest, Utf8DecodeFourBytes) {
    const char* text = "\xF0\x9F\x98\x80";  // U+1F600
    auto result = unicode::utf8_decode(text, 4);

    EXPECT_EQ(result.code_point, 0x1F600u);
    EXPECT_EQ(result.bytes_consumed, 4u);
}

TEST(UnicodeTest, Utf8DecodeTruncatedConsumesOneByte) {
    const char* text = "\xE4\xB8";
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(result.code_point, unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(result.bytes_consumed, 1u);
}

TEST(UnicodeTest, Utf8DecodeStrayContinuation) {
    const char* text = "\x80" "a";
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(result.code_point, unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(result.bytes_consumed, 1u);
}

TEST(UnicodeTest, Utf8Encode) {
    char buffer[4];

    EXPECT_EQ(unicode::utf8_encode('A', buffer), 1u);
    EXPECT_EQ(buffer[0], 'A');

    EXPECT_EQ(unicode::utf8_encode(0x4E2D, buffer), 3u);
    EXPECT_EQ(static_cast<u8>(buffer[0]), 0xE4);
    EXPECT_EQ(static_cast<u8>(buffer[1]), 0xB8);
    EXPECT_EQ(static_cast<u8>(buffer[2]), 0xAD);
}

// ============================================================================
// String Tests
// ============================================================================

TEST(StringTest, DefaultConstruction) {
    String s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
    EXPECT_STREQ(s.c_str(), "");
}

TEST(StringTest, NullPointerIsEmpty) {
    const char* nothing = nullptr;
    String s(nothing);
    EXPECT_TRUE(s.empty());
}

TEST(StringTest, CodePointCount) {
    String s("a\xC3\xA9\xF0\x9F\x98\x80");
    EXPECT_EQ(s.size(), 7u);
    EXPECT_EQ(s.code_point_count(), 3u);
}

TEST(StringTest, AppendCodePoint) {
    String s("x");
    s.append(static_cast<unicode::CodePoint>(0x00E9));
    EXPECT_EQ(s, "x\xC3\xA9");
}

TEST(StringTest, Substring) {
    String s("Hello, World!");
    EXPECT_EQ(s.substring(0, 5), "Hello");
    EXPECT_EQ(s.substring(7), "World!");
    EXPECT_TRUE(s.substring(100).empty());
}

TEST(StringTest, PrefixCodePoints) {
    String s("\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(s.prefix_code_points(2), "\xC3\xA9t");
    EXPECT_EQ(s.prefix_code_points(10), s);
    EXPECT_TRUE(s.prefix_code_points(0).empty());
}

TEST(StringTest, Find) {
    String s("speed: 10");
    ASSERT_TRUE(s.find(':').has_value());
    EXPECT_EQ(*s.find(':'), 5u);
    ASSERT_TRUE(s.find(String("10")).has_value());
    EXPECT_EQ(*s.find(String("10")), 7u);
    EXPECT_FALSE(s.find('x').has_value());
    EXPECT_FALSE(s.find(':', 6).has_value());
}

TEST(StringTest, StartsEndsContains) {
    String s("[@delay:100]");
    EXPECT_TRUE(s.starts_with("[@"));
    EXPECT_TRUE(s.ends_with("]"));
    EXPECT_TRUE(s.contains("delay"));
    EXPECT_FALSE(s.contains("speed"));
}

TEST(StringTest, Trim) {
    EXPECT_EQ(String("  hi \t\n").trim(), "hi");
    EXPECT_EQ(String("hi").trim(), "hi");
    EXPECT_TRUE(String(" \t ").trim().empty());
}

TEST(StringTest, Split) {
    auto parts = String("a[@b[@c").split("[@");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");

    auto whole = String("abc").split("");
    ASSERT_EQ(whole.size(), 1u);
    EXPECT_EQ(whole[0], "abc");
}

TEST(StringTest, Concatenation) {
    String a("Hello");
    String b(" there");
    EXPECT_EQ(a + b, "Hello there");

    a += b;
    a += std::string_view("!");
    EXPECT_EQ(a, "Hello there!");
}

TEST(StringTest, Literal) {
    auto s = "typed"_s;
    EXPECT_EQ(s.size(), 5u);
    EXPECT_EQ(s, String("typed"));
}

TEST(StringTest, Hashable) {
    std::unordered_set<String> names;
    names.insert("log");
    names.insert("log");
    names.insert("print");
    EXPECT_EQ(names.size(), 2u);
    EXPECT_TRUE(names.contains("print"));
}

// ============================================================================
// StringBuilder Tests
// ============================================================================

TEST(StringBuilderTest, AppendMixed) {
    StringBuilder sb;
    sb.append("count=").append(static_cast<i64>(42)).append(',').append(String("ok"));
    EXPECT_EQ(sb.build(), "count=42,ok");
    EXPECT_EQ(sb.size(), 11u);
}

TEST(StringBuilderTest, AppendDouble) {
    StringBuilder sb;
    sb.append(1.5);
    EXPECT_EQ(sb.build(), "1.5");
}

TEST(StringBuilderTest, Clear) {
    StringBuilder sb;
    sb.append("abc");
    EXPECT_FALSE(sb.empty());
    sb.clear();
    EXPECT_TRUE(sb.empty());
    EXPECT_TRUE(sb.build().empty());
}
