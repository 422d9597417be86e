//! # Cursor Tests
//!
//! Byte reads, line/position bookkeeping, push-back across newlines and
//! buffer refills, whitespace skipping and source failures.

#include "stream/cursor.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace jsev;
using namespace jsev::stream;

namespace {

/// Yields `data`, then fails every later read.
class FailingSource : public ByteSource {
public:
    explicit FailingSource(std::string data) : data_(std::move(data)) {}

    auto read(char* buffer, size_t capacity) -> Result<size_t, std::string> override {
        if (sent_) {
            return std::string("device unplugged");
        }
        sent_ = true;
        size_t n = std::min(capacity, data_.size());
        data_.copy(buffer, n);
        return n;
    }

private:
    std::string data_;
    bool sent_ = false;
};

} // namespace

TEST(CursorTest, StartsAtLineOnePositionZero) {
    StringSource source("");
    Cursor cursor(source);
    EXPECT_EQ(cursor.line(), 1u);
    EXPECT_EQ(cursor.position(), 0u);
    EXPECT_EQ(cursor.offset(), 0u);
}

TEST(CursorTest, AdvanceTracksCoordinates) {
    StringSource source("{\n\"a");
    Cursor cursor(source);

    EXPECT_EQ(cursor.advance(), '{');
    EXPECT_EQ(cursor.line(), 1u);
    EXPECT_EQ(cursor.position(), 1u);

    EXPECT_EQ(cursor.advance(), '\n');
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 0u);

    EXPECT_EQ(cursor.advance(), '"');
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 1u);

    EXPECT_EQ(cursor.advance(), 'a');
    EXPECT_EQ(cursor.offset(), 4u);

    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
    EXPECT_TRUE(cursor.at_end());
    EXPECT_FALSE(cursor.io_error().has_value());
}

TEST(CursorTest, EndOfInputIsSticky) {
    StringSource source("x");
    Cursor cursor(source);
    EXPECT_EQ(cursor.advance(), 'x');
    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
    EXPECT_EQ(cursor.position(), 1u);
    EXPECT_EQ(cursor.offset(), 1u);
}

TEST(CursorTest, HighBytesAreNonNegative) {
    StringSource source("\xA0\xFF");
    Cursor cursor(source);
    EXPECT_EQ(cursor.advance(), 0xA0);
    EXPECT_EQ(cursor.advance(), 0xFF);
}

TEST(CursorTest, PushBackRestoresPosition) {
    StringSource source("ab");
    Cursor cursor(source);
    cursor.advance();
    cursor.advance();
    cursor.push_back();
    EXPECT_EQ(cursor.line(), 1u);
    EXPECT_EQ(cursor.position(), 1u);
    EXPECT_EQ(cursor.offset(), 1u);
    EXPECT_EQ(cursor.advance(), 'b');
    EXPECT_EQ(cursor.position(), 2u);
}

TEST(CursorTest, PushBackAcrossNewline) {
    StringSource source("abc\nd");
    Cursor cursor(source);
    for (int i = 0; i < 4; ++i) {
        cursor.advance();
    }
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 0u);

    cursor.push_back();
    EXPECT_EQ(cursor.line(), 1u);
    EXPECT_EQ(cursor.position(), 3u);

    EXPECT_EQ(cursor.advance(), '\n');
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 0u);
    EXPECT_EQ(cursor.advance(), 'd');
    EXPECT_EQ(cursor.position(), 1u);
}

TEST(CursorTest, PushBackAcrossBlankLines) {
    StringSource source("\n\n");
    Cursor cursor(source);
    cursor.advance();
    cursor.advance();
    EXPECT_EQ(cursor.line(), 3u);
    cursor.push_back();
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(CursorTest, PushBackAcrossBufferRefill) {
    StringSource source("abcdef");
    Cursor cursor(source, 2);

    std::string seen;
    for (int i = 0; i < 3; ++i) {
        seen += static_cast<char>(cursor.advance());
    }
    cursor.push_back();
    seen += static_cast<char>(cursor.advance());
    seen += static_cast<char>(cursor.advance());

    EXPECT_EQ(seen, "abccd");
    EXPECT_EQ(cursor.offset(), 4u);
}

TEST(CursorTest, SmallBufferReadsEverything) {
    std::string text = "{\"key\": [1, 2, 3]}\n";
    StringSource source(text);
    Cursor cursor(source, 1);

    std::string seen;
    for (int c = cursor.advance(); c != END_OF_INPUT; c = cursor.advance()) {
        seen += static_cast<char>(c);
    }
    EXPECT_EQ(seen, text);
    EXPECT_EQ(cursor.offset(), text.size());
}

TEST(CursorTest, SkipWhitespace) {
    StringSource source(" \t\r\n\v\f x");
    Cursor cursor(source);
    EXPECT_EQ(cursor.skip_whitespace(), 'x');
    EXPECT_EQ(cursor.line(), 2u);
    EXPECT_EQ(cursor.position(), 4u);
    EXPECT_EQ(cursor.skip_whitespace(), END_OF_INPUT);
}

TEST(CursorTest, ExtendedWhitespace) {
    StringSource extended("\x85\xA0x");
    Cursor lenient(extended);
    EXPECT_EQ(lenient.skip_whitespace(), 'x');

    StringSource strict_source("\x85\xA0x");
    Cursor strict(strict_source, DEFAULT_BUFFER_SIZE, false);
    EXPECT_EQ(strict.skip_whitespace(), 0x85);
}

TEST(CursorTest, ResetCoordinatesKeepsOffset) {
    StringSource source("ab\ncd");
    Cursor cursor(source);
    for (int i = 0; i < 4; ++i) {
        cursor.advance();
    }
    cursor.reset_coordinates();
    EXPECT_EQ(cursor.line(), 1u);
    EXPECT_EQ(cursor.position(), 0u);
    EXPECT_EQ(cursor.offset(), 4u);
    EXPECT_EQ(cursor.advance(), 'd');
    EXPECT_EQ(cursor.position(), 1u);
}

TEST(CursorTest, SourceFailureRecorded) {
    FailingSource source("ab");
    Cursor cursor(source);
    EXPECT_EQ(cursor.advance(), 'a');
    EXPECT_EQ(cursor.advance(), 'b');
    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
    ASSERT_TRUE(cursor.io_error().has_value());
    EXPECT_EQ(*cursor.io_error(), "device unplugged");
    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
}

TEST(CursorTest, IstreamSource) {
    std::istringstream in("[1]");
    IstreamSource source(in);
    Cursor cursor(source, 2);
    EXPECT_EQ(cursor.advance(), '[');
    EXPECT_EQ(cursor.advance(), '1');
    EXPECT_EQ(cursor.advance(), ']');
    EXPECT_EQ(cursor.advance(), END_OF_INPUT);
    EXPECT_FALSE(cursor.io_error().has_value());
}
