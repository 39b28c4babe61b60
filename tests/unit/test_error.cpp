/**
 * @file test_error.cpp
 * @brief Unit tests for Error and Result
 */

#include <gtest/gtest.h>
#include <p2plink/error.h>

using namespace p2plink;

namespace {

Result<int> parse_positive(int value) {
  P2PLINK_REQUIRE(value > 0, ErrorCode::InvalidArgument, "not positive");
  return value;
}

Result<void> chain(int value) {
  P2PLINK_TRY(parse_positive(value));
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
  Error err;
  EXPECT_TRUE(err.is_ok());
  EXPECT_FALSE(err.is_error());
  EXPECT_EQ(err.code, ErrorCode::Success);
}

TEST(ErrorTest, ToStringIncludesMessageAndDetails) {
  Error err(ErrorCode::PeerNotFound, "no such peer", "02:00:00:00:00:09");
  EXPECT_EQ(err.to_string(), "PeerNotFound: no such peer (02:00:00:00:00:09)");

  Error bare(ErrorCode::Busy);
  EXPECT_EQ(bare.to_string(), "Busy");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::P2pDisabled), "P2pDisabled");
  EXPECT_STREQ(error_code_name(ErrorCode::ApproverMismatch),
               "ApproverMismatch");
  EXPECT_STREQ(error_code_name(ErrorCode::DBusError), "DBusError");
}

TEST(ErrorTest, Recoverable) {
  EXPECT_TRUE(is_recoverable(ErrorCode::Busy));
  EXPECT_TRUE(is_recoverable(ErrorCode::DriverCommandFailed));
  EXPECT_FALSE(is_recoverable(ErrorCode::P2pUnsupported));
  EXPECT_FALSE(is_recoverable(ErrorCode::NotSupported));
  EXPECT_FALSE(is_recoverable(ErrorCode::PermissionDenied));
}

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, HoldsValue) {
  Result<int> result = parse_positive(5);
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(result.to_optional(), std::optional<int>(5));
}

TEST(ResultTest, HoldsError) {
  Result<int> result = parse_positive(-1);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(result.error().message, "not positive");
  EXPECT_EQ(result.value_or(7), 7);
  EXPECT_FALSE(result.to_optional().has_value());
}

TEST(ResultTest, VoidResult) {
  Result<void> ok = Result<void>::ok();
  EXPECT_TRUE(ok.is_ok());

  Result<void> failed(ErrorCode::Timeout, "late");
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::Timeout);
}

TEST(ResultTest, TryPropagates) {
  EXPECT_TRUE(chain(3).is_ok());

  auto failed = chain(0);
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::InvalidArgument);
}
