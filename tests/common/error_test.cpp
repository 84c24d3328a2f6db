// =============================================================================
// zstd-pbf - Error Handling Tests
// =============================================================================
// Unit tests for ErrorCode mapping, exception context and Result helpers.
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include "zpbf/common/error.h"

namespace zpbf::test {

TEST(ErrorCodeTest, ExitCodesMatchCategories) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kUnsupportedCodec), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kCodecError), 5);
}

TEST(ErrorCodeTest, NamesAreDistinct) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kFormatError), "format error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kUnsupportedCodec), "unsupported codec");
    EXPECT_NE(errorCodeToString(ErrorCode::kIOError), errorCodeToString(ErrorCode::kCodecError));
}

TEST(ExceptionTest, SubclassesCarryTheirCode) {
    EXPECT_EQ(UsageError("x").code(), ErrorCode::kUsageError);
    EXPECT_EQ(IOError("x").code(), ErrorCode::kIOError);
    EXPECT_EQ(FormatError("x").code(), ErrorCode::kFormatError);
    EXPECT_EQ(UnsupportedError("x").code(), ErrorCode::kUnsupportedCodec);
    EXPECT_EQ(CodecError("x").exitCode(), 5);
}

TEST(ExceptionTest, WhatIncludesMessageAndContext) {
    FormatError error("header too large",
                      ErrorContext("planet.osm.pbf").withFrame(7).withOffset(1024));
    std::string what = error.what();
    EXPECT_NE(what.find("header too large"), std::string::npos);
    EXPECT_NE(what.find("planet.osm.pbf"), std::string::npos);
    EXPECT_NE(what.find("frame: 7"), std::string::npos);
    EXPECT_NE(what.find("offset: 1024"), std::string::npos);
    EXPECT_EQ(error.message(), "header too large");
}

TEST(ExceptionTest, AttachContextKeepsExistingContext) {
    FormatError bare("corrupt zlib blob");
    EXPECT_FALSE(bare.context().has_value());
    bare.attachContext(ErrorContext("in.pbf").withFrame(3));
    ASSERT_TRUE(bare.context().has_value());
    EXPECT_EQ(bare.context()->frameIndex.value_or(0), 3u);
    EXPECT_NE(std::string(bare.what()).find("in.pbf"), std::string::npos);

    bare.attachContext(ErrorContext("other.pbf").withFrame(9));
    EXPECT_EQ(bare.context()->filePath, "in.pbf");
    EXPECT_EQ(bare.context()->frameIndex.value_or(0), 3u);
}

TEST(ExceptionTest, IOErrorIncludesSystemError) {
    auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    IOError error("Could not open file 'missing.pbf'", ec, ErrorContext("missing.pbf"));
    std::string what = error.what();
    EXPECT_NE(what.find("missing.pbf"), std::string::npos);
    EXPECT_NE(what.find(ec.message()), std::string::npos);
    EXPECT_EQ(error.exitCode(), 2);
}

TEST(ResultTest, UnwrapReturnsValue) {
    Result<int> ok = 42;
    EXPECT_EQ(unwrapOrThrow(std::move(ok)), 42);
}

TEST(ResultTest, UnwrapThrowsMatchingException) {
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kFormatError, "bad")), FormatError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kCodecError, "bad")), CodecError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kIOError, "bad")), IOError);

    try {
        (void)unwrapOrThrow(makeError<int>(ErrorCode::kUnsupportedCodec, "lzma"));
        FAIL() << "expected UnsupportedError";
    } catch (const UnsupportedError& e) {
        EXPECT_EQ(e.message(), "lzma");
    }
}

}  // namespace zpbf::test
