//! # Common Definitions Tests

#include "common.hpp"
#include "stream/byte_source.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

using namespace jsev;

TEST(CommonTest, VersionMatchesBuild) {
    EXPECT_STREQ(VERSION, JSEV_VERSION_STRING);
    EXPECT_FALSE(std::string(VERSION).empty());
}

TEST(CommonTest, ResultHoldsValueOrError) {
    Result<int> ok = 42;
    ASSERT_TRUE(is_ok(ok));
    EXPECT_FALSE(is_err(ok));
    EXPECT_EQ(unwrap(ok), 42);

    Result<int> failed = std::string("read error");
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed), "read error");
}

TEST(CommonTest, UnwrapReturnsMutableValue) {
    Result<std::string, int> result = std::string("abc");
    unwrap(result) += "d";
    EXPECT_EQ(unwrap(result), "abcd");
}

TEST(CommonTest, FileSourceOpenFailureIsResultError) {
    auto missing = std::filesystem::temp_directory_path() / "jsev_common_test_missing.json";
    auto file = stream::FileSource::open(missing.string());
    ASSERT_TRUE(is_err(file));
    EXPECT_EQ(unwrap_err(file).rfind("cannot open ", 0), 0u);
}

TEST(CommonTest, MakeBoxOwnsSource) {
    Box<stream::ByteSource> source = make_box<stream::StringSource>("[]");
    char buffer[8];
    auto read = source->read(buffer, sizeof(buffer));
    ASSERT_TRUE(is_ok(read));
    EXPECT_EQ(unwrap(read), 2u);
    EXPECT_EQ(std::string(buffer, 2), "[]");
}
