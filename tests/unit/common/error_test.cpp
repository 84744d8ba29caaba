/// @file error_test.cpp
/// @brief Tests for RunLens error codes and HTTP mapping

#include <gtest/gtest.h>

#include "common/error.h"

namespace runlens {
namespace {

TEST(ErrorTest, MakeErrorMapsToAbslCode) {
    EXPECT_TRUE(absl::IsInvalidArgument(MakeError(ErrorCode::kValidationError, "empty")));
    EXPECT_TRUE(absl::IsInvalidArgument(MakeError(ErrorCode::kMalformedReport, "bad run")));
    EXPECT_TRUE(absl::IsFailedPrecondition(MakeError(ErrorCode::kConfigurationError, "port")));
    EXPECT_TRUE(absl::IsFailedPrecondition(MakeError(ErrorCode::kIllegalTransition, "done")));
    EXPECT_EQ(MakeError(ErrorCode::kValidationError, "empty").message(), "empty");
}

TEST(ErrorTest, ErrorCodeSurvivesCopies) {
    absl::Status original = MakeError(ErrorCode::kIllegalTransition, "job 3 is completed");
    absl::StatusOr<int> wrapped = original;

    auto code = GetErrorCode(wrapped.status());
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, ErrorCode::kIllegalTransition);
    EXPECT_EQ(ErrorCodeName(*code), "illegal_transition");
}

TEST(ErrorTest, PlainStatusHasNoErrorCode) {
    EXPECT_FALSE(GetErrorCode(absl::InvalidArgumentError("x")).has_value());
    EXPECT_FALSE(GetErrorCode(absl::OkStatus()).has_value());
}

TEST(ErrorTest, HttpStatusMapping) {
    EXPECT_EQ(ToHttpStatus(absl::OkStatus()), 200);
    EXPECT_EQ(ToHttpStatus(MakeError(ErrorCode::kValidationError, "x")), 400);
    EXPECT_EQ(ToHttpStatus(absl::OutOfRangeError("x")), 400);
    EXPECT_EQ(ToHttpStatus(absl::NotFoundError("x")), 404);
    EXPECT_EQ(ToHttpStatus(MakeError(ErrorCode::kIllegalTransition, "x")), 409);
    EXPECT_EQ(ToHttpStatus(absl::UnavailableError("x")), 503);
    EXPECT_EQ(ToHttpStatus(InternalError("x")), 500);
}

}  // namespace
}  // namespace runlens
