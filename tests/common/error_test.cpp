// =============================================================================
// pipeflow - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exceptions and Result helpers.
// =============================================================================

#include "pflow/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace pflow {
namespace {

TEST(ErrorTest, ErrorCodeStrings) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kSuccess), "success");
    EXPECT_EQ(errorCodeToString(ErrorCode::kInvalidArgument), "invalid argument");
    EXPECT_EQ(errorCodeToString(ErrorCode::kCancelled), "cancelled");
    EXPECT_EQ(errorCodeToString(ErrorCode::kStageFailed), "stage failed");
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_TRUE(isError(ErrorCode::kStreamClosed));
}

TEST(ErrorTest, ExceptionWhatIncludesContext) {
    ErrorContext context("map");
    context.withItem(7).withWorker(2);
    InvalidStateError error("stream closed twice", context);

    const std::string what = error.what();
    EXPECT_NE(what.find("[invalid state] stream closed twice"), std::string::npos);
    EXPECT_NE(what.find("stage: map"), std::string::npos);
    EXPECT_NE(what.find("item: 7"), std::string::npos);
    EXPECT_NE(what.find("worker: 2"), std::string::npos);
    EXPECT_EQ(error.code(), ErrorCode::kInvalidState);
    EXPECT_TRUE(error.hasContext());
}

TEST(ErrorTest, ExceptionWithoutContext) {
    InvalidArgumentError error("bad worker count");
    EXPECT_STREQ(error.what(), "[invalid argument] bad worker count");
    EXPECT_FALSE(error.hasContext());
}

TEST(ErrorTest, StageFailureKeepsCause) {
    auto cause = std::make_exception_ptr(std::runtime_error("boom"));
    StageFailure failure("map failed", cause);
    ASSERT_TRUE(failure.cause());
    EXPECT_THROW(std::rethrow_exception(failure.cause()), std::runtime_error);
}

TEST(ErrorTest, MakeErrorFormatsMessage) {
    Result<int> result = makeError(ErrorCode::kInvalidArgument, "size {} out of {}", 5, 3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(result.error().message(), "size 5 out of 3");
    EXPECT_EQ(result.error().toString(), "[invalid argument] size 5 out of 3");
}

TEST(ErrorTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(makeSuccess(42)), 42);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kInvalidState, "closed")),
                 InvalidStateError);
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kInvalidArgument, "bad")),
                 InvalidArgumentError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ErrorTest, ErrorFromException) {
    auto fromStd = errorFromException(std::make_exception_ptr(std::runtime_error("oops")));
    EXPECT_EQ(fromStd.code(), ErrorCode::kStageFailed);
    EXPECT_EQ(fromStd.message(), "oops");

    auto fromPFlow = errorFromException(std::make_exception_ptr(InvalidArgumentError("bad")));
    EXPECT_EQ(fromPFlow.code(), ErrorCode::kInvalidArgument);

    auto fromInt = errorFromException(std::make_exception_ptr(17));
    EXPECT_EQ(fromInt.code(), ErrorCode::kStageFailed);

    auto missing = errorFromException(nullptr);
    EXPECT_EQ(missing.code(), ErrorCode::kInternalError);
}

TEST(ErrorTest, TryExecute) {
    auto ok = tryExecute([] { return 3; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 3);

    auto failed = tryExecute([]() -> int { throw std::runtime_error("nope"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kStageFailed);

    auto voidOk = tryExecute([] {});
    EXPECT_TRUE(voidOk.has_value());
}

TEST(ErrorTest, ToExceptionMatchesCode) {
    Error error(ErrorCode::kStageFailed, "worker died");
    EXPECT_THROW(error.throwException(), StageFailure);
    EXPECT_EQ(error.toException().code(), ErrorCode::kStageFailed);
    EXPECT_EQ(Error(ErrorCode::kCancelled, "x"), Error(ErrorCode::kCancelled, "x"));
}

}  // namespace
}  // namespace pflow
