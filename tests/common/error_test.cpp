// =============================================================================
// docsan - Error Handling Tests
// =============================================================================
// Unit tests for error codes, the exception hierarchy and Result helpers.
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "docsan/common/error.h"

namespace docsan::test {

TEST(ErrorCodeTest, ExitCodesAreStable) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kMappingFileError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kPlaceholderCollision), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kDetectorUnavailable), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidArgument), 6);
    EXPECT_EQ(toExitCode(ErrorCode::kFileNotFound), 7);
    EXPECT_EQ(toExitCode(ErrorCode::kFileExists), 8);
    EXPECT_EQ(toExitCode(ErrorCode::kLeakDetected), 9);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidState), 10);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kPlaceholderCollision), "placeholder collision");
    EXPECT_EQ(errorCodeToString(ErrorCode::kLeakDetected), "leak detected");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kMappingFileError));
}

TEST(ExceptionTest, WhatIncludesCategoryAndContext) {
    MappingFileError ex("bad entry", ErrorContext("map.dsm").withEntry(3).withOffset(120));
    const std::string what = ex.what();
    EXPECT_NE(what.find("[mapping file error]"), std::string::npos);
    EXPECT_NE(what.find("bad entry"), std::string::npos);
    EXPECT_NE(what.find("file: map.dsm"), std::string::npos);
    EXPECT_NE(what.find("entry: 3"), std::string::npos);
    EXPECT_NE(what.find("offset: 120"), std::string::npos);
    EXPECT_EQ(ex.message(), "bad entry");
    EXPECT_EQ(ex.exitCode(), 3);
}

TEST(ExceptionTest, ChecksumMismatchKeepsValues) {
    MappingFileError ex(0x1234, 0x5678, ErrorContext("x.dsm"));
    ASSERT_TRUE(ex.expected().has_value());
    EXPECT_EQ(*ex.expected(), 0x1234U);
    EXPECT_EQ(*ex.actual(), 0x5678U);
    EXPECT_NE(ex.message().find("checksum mismatch"), std::string::npos);
}

TEST(ExceptionTest, CollisionCarriesOffset) {
    PlaceholderCollisionError ex(17, "\xE2\x9F\xA6PERSON_1");
    EXPECT_EQ(ex.code(), ErrorCode::kPlaceholderCollision);
    ASSERT_TRUE(ex.offset().has_value());
    EXPECT_EQ(*ex.offset(), 17U);
    ASSERT_TRUE(ex.hasContext());
    ASSERT_TRUE(ex.context()->byteOffset.has_value());
    EXPECT_EQ(*ex.context()->byteOffset, 17U);
}

TEST(ResultTest, UnwrapSuccess) {
    Result<int> ok = makeSuccess(42);
    EXPECT_EQ(unwrapOrThrow(std::move(ok)), 42);
}

TEST(ResultTest, UnwrapErrorThrowsMatchingType) {
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kMappingFileError, "x")),
                 MappingFileError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kInvalidArgument, "y")), UsageError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kDetectorUnavailable, "z")),
                 DetectorUnavailableError);
}

TEST(ResultTest, TryExecuteCapturesExceptions) {
    auto failed = tryExecute([]() -> int { throw LeakDetectedError("leak"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kLeakDetected);
    EXPECT_EQ(failed.error().message(), "leak");

    auto plain = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code(), ErrorCode::kIOError);

    auto fine = tryExecute([] { return 7; });
    ASSERT_TRUE(fine.has_value());
    EXPECT_EQ(*fine, 7);

    auto voidResult = tryExecute([] {});
    EXPECT_TRUE(voidResult.has_value());
}

TEST(ResultTest, ErrorToException) {
    Error error(ErrorCode::kFileExists, "exists");
    auto ex = error.toException();
    EXPECT_EQ(ex.code(), ErrorCode::kFileExists);
    EXPECT_EQ(error.exitCode(), 8);
}

}  // namespace docsan::test
