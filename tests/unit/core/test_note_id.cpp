#include <gtest/gtest.h>

#include <set>
#include <unordered_set>

#include "notesd/core/note_id.hpp"
#include "test_helpers.hpp"

using namespace notesd::core;
using namespace notesd::test;
using notesd::ErrorCode;

class NoteIdTest : public ::testing::Test {};

TEST_F(NoteIdTest, GenerateCanonicalUuid) {
  auto id = NoteId::generate();
  auto str = id.toString();

  EXPECT_TRUE(id.isValid());
  ASSERT_EQ(str.length(), 36);
  EXPECT_EQ(str[8], '-');
  EXPECT_EQ(str[13], '-');
  EXPECT_EQ(str[18], '-');
  EXPECT_EQ(str[23], '-');

  // Version 4, RFC 4122 variant
  EXPECT_EQ(str[14], '4');
  EXPECT_NE(std::string("89ab").find(str[19]), std::string::npos);

  for (char c : str) {
    EXPECT_TRUE(c == '-' || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << str;
  }
}

TEST_F(NoteIdTest, GenerateIsUnique) {
  std::unordered_set<NoteId> ids;
  for (int i = 0; i < 10000; ++i) {
    EXPECT_TRUE(ids.insert(NoteId::generate()).second);
  }
}

TEST_F(NoteIdTest, FromStringValid) {
  std::string uuid = "3fa85f64-5717-4562-b3fc-2c963f66afa6";
  auto result = NoteId::fromString(uuid);

  ASSERT_OK(result);
  EXPECT_EQ(result->toString(), uuid);
  EXPECT_TRUE(result->isValid());
}

TEST_F(NoteIdTest, FromStringNormalizesCase) {
  auto upper = NoteId::fromString("3FA85F64-5717-4562-B3FC-2C963F66AFA6");
  auto lower = NoteId::fromString("3fa85f64-5717-4562-b3fc-2c963f66afa6");

  ASSERT_OK(upper);
  ASSERT_OK(lower);
  EXPECT_EQ(*upper, *lower);
  EXPECT_EQ(upper->toString(), "3fa85f64-5717-4562-b3fc-2c963f66afa6");
}

TEST_F(NoteIdTest, FromStringInvalid) {
  EXPECT_ERROR(NoteId::fromString(""), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(NoteId::fromString("not-a-uuid"), ErrorCode::kInvalidArgument);
  // Hyphens misplaced
  EXPECT_ERROR(NoteId::fromString("3fa85f645-717-4562-b3fc-2c963f66afa6"), ErrorCode::kInvalidArgument);
  // No hyphens
  EXPECT_ERROR(NoteId::fromString("3fa85f6457174562b3fc2c963f66afa6"), ErrorCode::kInvalidArgument);
  // Non-hex character
  EXPECT_ERROR(NoteId::fromString("3fa85f64-5717-4562-b3fc-2c963f66afag"), ErrorCode::kInvalidArgument);
  // Too long
  EXPECT_ERROR(NoteId::fromString("3fa85f64-5717-4562-b3fc-2c963f66afa6a"), ErrorCode::kInvalidArgument);
}

TEST_F(NoteIdTest, InvalidIdMessageNamesInput) {
  auto result = NoteId::fromString("bogus");
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("bogus"), std::string::npos);
}

TEST_F(NoteIdTest, DefaultIsInvalid) {
  NoteId id;
  EXPECT_FALSE(id.isValid());
}

TEST_F(NoteIdTest, Comparison) {
  auto a = NoteId::fromString("00000000-0000-4000-8000-000000000001");
  auto b = NoteId::fromString("00000000-0000-4000-8000-000000000002");
  ASSERT_OK(a);
  ASSERT_OK(b);

  EXPECT_EQ(*a, *a);
  EXPECT_NE(*a, *b);
  EXPECT_LT(*a, *b);

  std::set<NoteId> ordered{*b, *a};
  EXPECT_EQ(*ordered.begin(), *a);
}
