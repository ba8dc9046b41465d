#include <gtest/gtest.h>

#include "notesd/common.hpp"
#include "test_helpers.hpp"

using namespace notesd;

TEST(ErrorCodeTest, EveryCodeHasAName) {
  for (auto code : {ErrorCode::kInvalidArgument, ErrorCode::kParseError,
                    ErrorCode::kValidationError, ErrorCode::kNotFound, ErrorCode::kConfigError,
                    ErrorCode::kNetworkError, ErrorCode::kInternalError}) {
    EXPECT_NE(errorCodeToString(code), "Unknown error");
  }
  EXPECT_EQ(errorCodeToString(ErrorCode::kUnknownError), "Unknown error");
}

TEST(ErrorCodeTest, MakeErrorResultCarriesCodeAndMessage) {
  auto result = makeErrorResult<int>(ErrorCode::kNotFound, "missing");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kNotFound);
  EXPECT_EQ(result.error().message(), "missing");
}

TEST(VersionTest, FormatsSemver) {
  Version version{1, 2, 3, ""};
  EXPECT_EQ(version.toString(), "1.2.3");

  Version with_build{1, 2, 3, "abc"};
  EXPECT_EQ(with_build.toString(), "1.2.3+abc");

  EXPECT_FALSE(getVersion().toString().empty());
}
