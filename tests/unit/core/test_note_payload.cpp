#include <gtest/gtest.h>

#include "notesd/core/note.hpp"
#include "notesd/core/note_payload.hpp"
#include "test_helpers.hpp"

using namespace notesd::core;
using namespace notesd::test;
using notesd::ErrorCode;

TEST(NoteCreatePayloadTest, ParsesBothFields) {
  auto payload = parseNoteCreate(R"({"title": "A", "content": "B"})");
  ASSERT_OK(payload);
  EXPECT_EQ(payload->title, "A");
  EXPECT_EQ(payload->content, "B");
}

TEST(NoteCreatePayloadTest, IgnoresUnknownMembers) {
  auto payload = parseNoteCreate(R"({"title": "A", "content": "B", "id": "x", "extra": 1})");
  ASSERT_OK(payload);
  EXPECT_EQ(payload->title, "A");
}

TEST(NoteCreatePayloadTest, RequiresBothFields) {
  EXPECT_ERROR(parseNoteCreate(R"({"title": "A"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"({"content": "B"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"({"title": null, "content": "B"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate("{}"), ErrorCode::kInvalidArgument);
}

TEST(NoteCreatePayloadTest, RejectsWrongTypes) {
  EXPECT_ERROR(parseNoteCreate(R"({"title": 5, "content": "B"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"({"title": "A", "content": ["B"]})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"(["A", "B"])"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"("text")"), ErrorCode::kInvalidArgument);
}

TEST(NoteCreatePayloadTest, RejectsInvalidJson) {
  EXPECT_ERROR(parseNoteCreate(""), ErrorCode::kParseError);
  EXPECT_ERROR(parseNoteCreate("{\"title\": "), ErrorCode::kParseError);
}

TEST(NoteCreatePayloadTest, EnforcesBounds) {
  EXPECT_ERROR(parseNoteCreate(R"({"title": "", "content": "B"})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteCreate(R"({"title": "A", "content": ""})"), ErrorCode::kInvalidArgument);

  nlohmann::json at_limit{{"title", std::string(kMaxTitleLength, 'x')}, {"content", "B"}};
  EXPECT_OK(parseNoteCreate(at_limit.dump()));

  nlohmann::json over_limit{{"title", std::string(kMaxTitleLength + 1, 'x')}, {"content", "B"}};
  EXPECT_ERROR(parseNoteCreate(over_limit.dump()), ErrorCode::kInvalidArgument);
}

TEST(NoteUpdatePayloadTest, FieldsAreOptional) {
  auto title_only = parseNoteUpdate(R"({"title": "New"})");
  ASSERT_OK(title_only);
  EXPECT_EQ(title_only->title, "New");
  EXPECT_FALSE(title_only->content.has_value());
  EXPECT_FALSE(title_only->empty());

  auto content_only = parseNoteUpdate(R"({"content": "Body"})");
  ASSERT_OK(content_only);
  EXPECT_FALSE(content_only->title.has_value());
  EXPECT_EQ(content_only->content, "Body");
}

TEST(NoteUpdatePayloadTest, EmptyObjectParsesAsEmptyUpdate) {
  auto payload = parseNoteUpdate("{}");
  ASSERT_OK(payload);
  EXPECT_TRUE(payload->empty());
}

TEST(NoteUpdatePayloadTest, NullMeansAbsent) {
  auto payload = parseNoteUpdate(R"({"title": null, "content": null})");
  ASSERT_OK(payload);
  EXPECT_TRUE(payload->empty());
}

TEST(NoteUpdatePayloadTest, SuppliedFieldsMustBeInBounds) {
  EXPECT_ERROR(parseNoteUpdate(R"({"title": ""})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteUpdate(R"({"content": ""})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteUpdate(R"({"title": 1})"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteUpdate("[]"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(parseNoteUpdate("not json"), ErrorCode::kParseError);
}
