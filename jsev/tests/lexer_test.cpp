//! # Lexical Helper Tests
//!
//! String unescaping (escapes, `\u` code points, surrogate pairs, invalid
//! UTF-8) and number classification.

#include "stream/lexer.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace jsev;
using namespace jsev::stream;

namespace {

auto decoded(std::string_view raw) -> std::string {
    auto result = decode_string(raw);
    EXPECT_TRUE(is_ok(result)) << "decode failed for: " << raw;
    return is_ok(result) ? unwrap(result) : std::string();
}

auto number(std::string_view lexeme) -> Number {
    auto result = parse_number_lexeme(lexeme);
    EXPECT_TRUE(is_ok(result)) << "parse failed for: " << lexeme;
    return is_ok(result) ? unwrap(result) : Number();
}

} // namespace

// ============================================================================
// Byte Classification
// ============================================================================

TEST(ByteClassTest, NumberBytes) {
    for (char c : std::string("0123456789+-.eE")) {
        EXPECT_TRUE(is_number_byte(c)) << c;
    }
    EXPECT_FALSE(is_number_byte('x'));
    EXPECT_FALSE(is_number_byte(','));
    EXPECT_FALSE(is_number_byte(' '));
}

TEST(ByteClassTest, DescribeByte) {
    EXPECT_EQ(describe_byte('f'), "f");
    EXPECT_EQ(describe_byte('}'), "}");
    EXPECT_EQ(describe_byte('\n'), "\\x0a");
    EXPECT_EQ(describe_byte(0xFF), "\\xff");
    EXPECT_EQ(quote_bytes("nu\tl"), "\"nu\\x09l\"");
}

TEST(ByteClassTest, AppendUtf8) {
    std::string out;
    append_utf8(out, 'A');
    append_utf8(out, 0xE9);
    append_utf8(out, 0x265E);
    append_utf8(out, 0x1F603);
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x99\x9E\xF0\x9F\x98\x83");
}

// ============================================================================
// String Decoding
// ============================================================================

TEST(DecodeStringTest, PlainTextUnchanged) {
    EXPECT_EQ(decoded("foo"), "foo");
    EXPECT_EQ(decoded(""), "");
    EXPECT_EQ(decoded("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(DecodeStringTest, SimpleEscapes) {
    EXPECT_EQ(decoded(R"(a\"b)"), "a\"b");
    EXPECT_EQ(decoded(R"(a\\b)"), "a\\b");
    EXPECT_EQ(decoded(R"(a\/b)"), "a/b");
    EXPECT_EQ(decoded(R"(a\'b)"), "a'b");
    EXPECT_EQ(decoded(R"(\b\f\n\r\t)"), "\b\f\n\r\t");
}

TEST(DecodeStringTest, UnicodeEscapes) {
    EXPECT_EQ(decoded(R"(\u265e\u2602)"), "\xE2\x99\x9E\xE2\x98\x82");
    EXPECT_EQ(decoded(R"(\u0041\u00e9)"), "A\xC3\xA9");
    EXPECT_EQ(decoded(R"(\u265E)"), "\xE2\x99\x9E");
}

TEST(DecodeStringTest, SurrogatePair) {
    EXPECT_EQ(decoded(R"(\uD83D\uDE03)"), "\xF0\x9F\x98\x83");
    EXPECT_EQ(decoded(R"(x\ud834\udd1ey)"), "x\xF0\x9D\x84\x9Ey");
}

TEST(DecodeStringTest, LoneSurrogatesBecomeReplacement) {
    // High surrogate followed by plain text
    EXPECT_EQ(decoded(R"(\uD83Dabc)"), "\xEF\xBF\xBD" "abc");
    // High surrogate followed by a non-surrogate escape, which is decoded on its own
    EXPECT_EQ(decoded(R"(\uD83D\u0041)"), "\xEF\xBF\xBD" "A");
    // Lone low surrogate
    EXPECT_EQ(decoded(R"(\uDE03)"), "\xEF\xBF\xBD");
    // Two high surrogates
    EXPECT_EQ(decoded(R"(\uD83D\uD83D)"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(DecodeStringTest, InvalidUtf8Coerced) {
    EXPECT_EQ(decoded("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    // Truncated two-byte sequence
    EXPECT_EQ(decoded("\xC3"), "\xEF\xBF\xBD");
    // Overlong encoding of '/'
    EXPECT_EQ(decoded("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(DecodeStringTest, InvalidEscapes) {
    EXPECT_TRUE(is_err(decode_string(R"(\x41)")));
    EXPECT_TRUE(is_err(decode_string(R"(\u12)")));
    EXPECT_TRUE(is_err(decode_string(R"(\u12G4)")));
    EXPECT_TRUE(is_err(decode_string("abc\\")));
}

TEST(DecodeStringTest, ControlBytesRejected) {
    auto result = decode_string("a\nb");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).detail.find("\\x0a"), std::string::npos);

    EXPECT_TRUE(is_err(decode_string(std::string_view("a\0b", 3))));
}

TEST(DecodeStringTest, UnescapedQuoteRejected) {
    EXPECT_TRUE(is_err(decode_string("a\"b")));
}

// ============================================================================
// Number Parsing
// ============================================================================

TEST(ParseNumberTest, Integers) {
    Number n = number("10");
    EXPECT_TRUE(n.is_integer());
    EXPECT_EQ(n.as_i64(), 10);

    EXPECT_EQ(number("-42").as_i64(), -42);
    EXPECT_EQ(number("+7").as_i64(), 7);
    EXPECT_EQ(number("0").as_i64(), 0);
    EXPECT_EQ(number("9223372036854775807").as_i64(), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(number("-9223372036854775808").as_i64(), std::numeric_limits<int64_t>::min());
}

TEST(ParseNumberTest, FloatsChosenLexically) {
    Number n = number("10.0");
    EXPECT_TRUE(n.is_float());
    EXPECT_DOUBLE_EQ(n.as_f64(), 10.0);

    EXPECT_TRUE(number("10e6").is_float());
    EXPECT_DOUBLE_EQ(number("10e6").as_f64(), 10e6);
    EXPECT_DOUBLE_EQ(number("-1.3").as_f64(), -1.3);
    EXPECT_DOUBLE_EQ(number("2E-2").as_f64(), 0.02);
    EXPECT_DOUBLE_EQ(number("1.5e+3").as_f64(), 1500.0);
}

TEST(ParseNumberTest, RepresentationMatters) {
    Number integer = number("10");
    Number floating = number("10.0");
    EXPECT_FALSE(integer == floating);
    EXPECT_TRUE(integer.numerically_equal(floating));
}

TEST(ParseNumberTest, IntegerOverflowIsError) {
    auto result = parse_number_lexeme("9223372036854775808");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).detail.find("out of range"), std::string::npos);
}

TEST(ParseNumberTest, FloatOverflowIsError) {
    EXPECT_TRUE(is_err(parse_number_lexeme("1e400")));
    EXPECT_TRUE(is_ok(parse_number_lexeme("1e-400")));
}

TEST(ParseNumberTest, MalformedLexemes) {
    EXPECT_TRUE(is_err(parse_number_lexeme("1e")));
    EXPECT_TRUE(is_err(parse_number_lexeme("1-2")));
    EXPECT_TRUE(is_err(parse_number_lexeme("--1")));
    EXPECT_TRUE(is_err(parse_number_lexeme("+-1")));
    EXPECT_TRUE(is_err(parse_number_lexeme("+")));
    EXPECT_TRUE(is_err(parse_number_lexeme("-")));
    EXPECT_TRUE(is_err(parse_number_lexeme("1.2.3")));
    EXPECT_TRUE(is_err(parse_number_lexeme(".")));
    EXPECT_TRUE(is_err(parse_number_lexeme("")));
}
