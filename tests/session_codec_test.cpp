#include "store/session_codec.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using store::Decode;
using store::Encode;
using testutil::At;
using tracker::Errc;

TEST(SessionCodec, DecodesSessionFileLayout) {
  const char *text = R"({
  "sessions": [
    {"start_iso": "2024-01-01T09:00:00-05:00",
     "end_iso": "2024-01-01T10:00:00-05:00", "note": "review"},
    {"start_iso": "2024-01-02T09:00:00-05:00", "end_iso": null, "note": ""}
  ]
})";
  auto doc = Decode(text);
  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->sessions.size(), 2u);
  EXPECT_EQ(doc->sessions[0].start, At("2024-01-01T09:00:00-05:00"));
  ASSERT_TRUE(doc->sessions[0].end.has_value());
  EXPECT_EQ(*doc->sessions[0].end, At("2024-01-01T10:00:00-05:00"));
  EXPECT_EQ(doc->sessions[0].note, "review");
  EXPECT_TRUE(doc->sessions[1].IsRunning());
}

TEST(SessionCodec, MissingSessionsKeyIsEmpty) {
  auto doc = Decode("{}");
  ASSERT_TRUE(doc.has_value());
  EXPECT_TRUE(doc->sessions.empty());
}

TEST(SessionCodec, RejectsStructuralProblems) {
  const char *bad[] = {
      "",
      "not json",
      "[]",
      R"({"sessions": {}})",
      R"({"sessions": [42]})",
      R"({"sessions": [{"start_iso": "2024-01-01T09:00:00+00:00", "note": ""}]})",
      R"({"sessions": [{"start_iso": 5, "end_iso": null, "note": ""}]})",
      R"({"sessions": [{"start_iso": "2024-01-01T09:00:00+00:00", "end_iso": null, "note": 3}]})",
      R"({"sessions": [{"start_iso": "2024-01-01T09:00:00+00:00", "end_iso": "soon", "note": ""}]})",
  };
  for (const char *text : bad) {
    auto doc = Decode(text);
    ASSERT_FALSE(doc.has_value()) << text;
    EXPECT_EQ(doc.error(), Errc::storage_corrupt) << text;
  }
}

TEST(SessionCodec, RejectsStartWithoutOffset) {
  auto doc = Decode(
      R"({"sessions": [{"start_iso": "2024-01-01T09:00:00", "end_iso": null, "note": ""}]})");
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error(), Errc::storage_corrupt);
}

TEST(SessionCodec, EncodesNullEndAndIndents) {
  store::Document doc;
  tracker::Session s;
  s.start = At("2024-01-02T09:00:00+01:00");
  s.note = "deep work";
  doc.sessions.push_back(s);

  const std::string text = Encode(doc);
  EXPECT_NE(text.find("\n  \"sessions\""), std::string::npos);
  auto j = nlohmann::json::parse(text);
  ASSERT_EQ(j["sessions"].size(), 1u);
  EXPECT_EQ(j["sessions"][0]["start_iso"], "2024-01-02T09:00:00+01:00");
  EXPECT_TRUE(j["sessions"][0]["end_iso"].is_null());
  EXPECT_EQ(j["sessions"][0]["note"], "deep work");
}

TEST(SessionCodec, EncodeReplacesInvalidUtf8InNote) {
  store::Document doc;
  tracker::Session s;
  s.start = At("2024-01-02T09:00:00Z");
  s.note = "caf\xe9";
  doc.sessions.push_back(s);

  std::string text;
  ASSERT_NO_THROW(text = Encode(doc));
  auto again = Decode(text);
  ASSERT_TRUE(again.has_value());
  ASSERT_EQ(again->sessions.size(), 1u);
  EXPECT_EQ(again->sessions[0].note, "caf\xef\xbf\xbd");
}

TEST(SessionCodec, PreservesUnknownFields) {
  const char *text = R"({
  "version": 2,
  "sessions": [
    {"start_iso": "2024-01-01T09:00:00+00:00", "end_iso": null, "note": "",
     "tags": ["a", "b"]}
  ]
})";
  auto doc = Decode(text);
  ASSERT_TRUE(doc.has_value());
  auto again = nlohmann::json::parse(Encode(*doc));
  EXPECT_EQ(again["version"], 2);
  EXPECT_EQ(again["sessions"][0]["tags"], nlohmann::json({"a", "b"}));
  EXPECT_EQ(again, nlohmann::json::parse(text));
}
