#include <gtest/gtest.h>

#include <string>

#include "core/types.hpp"

using namespace ctxmgr;

// ============================================================
// ToolResultTest
// ============================================================

TEST(ToolResultTest, SuccessHasSingleTextBlock) {
  auto result = ToolResult::success("hello");

  EXPECT_FALSE(result.is_error);
  ASSERT_EQ(result.content.size(), 1u);
  EXPECT_EQ(result.content[0]["type"], "text");
  EXPECT_EQ(result.content[0]["text"], "hello");
}

TEST(ToolResultTest, ErrorSetsFlag) {
  auto result = ToolResult::error("Error: boom");

  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.text(), "Error: boom");
}

TEST(ToolResultTest, ToJsonOmitsIsErrorOnSuccess) {
  auto j = ToolResult::success("ok").to_json();

  EXPECT_TRUE(j.contains("content"));
  EXPECT_FALSE(j.contains("isError"));
}

TEST(ToolResultTest, ToJsonCarriesIsError) {
  auto j = ToolResult::error("bad").to_json();

  ASSERT_TRUE(j.contains("isError"));
  EXPECT_EQ(j["isError"], true);
  EXPECT_EQ(j["content"][0]["text"], "bad");
}

TEST(ToolResultTest, FromJsonEnvelope) {
  json envelope = {
      {"content", json::array({ToolResult::text_block("a"), ToolResult::text_block("b")})},
      {"isError", true},
  };

  auto result = ToolResult::from_json(envelope);

  EXPECT_TRUE(result.is_error);
  ASSERT_EQ(result.content.size(), 2u);
  // 多个文本块以换行拼接
  EXPECT_EQ(result.text(), "a\nb");
}

TEST(ToolResultTest, TextSkipsNonTextBlocks) {
  ToolResult result;
  result.content.push_back(json{{"type", "image"}, {"data", "..."}});
  result.content.push_back(ToolResult::text_block("caption"));

  EXPECT_EQ(result.text(), "caption");
}

TEST(ToolResultTest, TextToleratesMalformedBlocks) {
  ToolResult result;
  result.content.push_back(json("raw"));
  result.content.push_back(json{{"type", 7}});
  result.content.push_back(json{{"type", "text"}, {"text", 3}});
  result.content.push_back(ToolResult::text_block("kept"));

  // 非对象或字段类型不对的块被跳过，不抛异常
  EXPECT_NO_THROW(result.text());
  EXPECT_EQ(result.text(), "kept");
}

TEST(ToolResultTest, IsEnvelope) {
  EXPECT_TRUE(ToolResult::is_envelope(json{{"content", json::array()}}));
  EXPECT_FALSE(ToolResult::is_envelope(json{{"content", "hello"}}));
  EXPECT_FALSE(ToolResult::is_envelope(json{{"text", "hello"}}));
  EXPECT_FALSE(ToolResult::is_envelope(json::array()));
}

TEST(ToolResultTest, FromJsonKeepsExtraFields) {
  json envelope = {
      {"content", json::array({ToolResult::text_block("a")})},
      {"_meta", {{"k", "v"}}},
  };

  auto result = ToolResult::from_json(envelope);

  EXPECT_EQ(result.extra["_meta"]["k"], "v");
  EXPECT_EQ(result.to_json(), envelope);
}

// ============================================================
// ResultTest
// ============================================================

TEST(ResultTest, SuccessAndFailure) {
  auto ok = Result<int>::success(7);
  EXPECT_TRUE(ok.ok());
  EXPECT_FALSE(ok.failed());
  EXPECT_EQ(*ok.value, 7);

  auto bad = Result<int>::failure("nope");
  EXPECT_FALSE(bad.ok());
  EXPECT_TRUE(bad.failed());
  EXPECT_EQ(*bad.error, "nope");
}
