#pragma once

#include "core/errors.hpp"
#include "core/session.hpp"
#include "logging/log.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// namespace store — persisted layout of the session collection:
//   {"sessions": [{"start_iso": "...", "end_iso": "..." | null, "note": "..."}]}
// Keys this version does not know are kept and written back.
namespace store {

using json = nlohmann::json;
using tracker::Errc;
using tracker::Result;
using tracker::Session;

inline constexpr const char *kSessionsKey = "sessions";
inline constexpr const char *kStartKey = "start_iso";
inline constexpr const char *kEndKey = "end_iso";
inline constexpr const char *kNoteKey = "note";

struct Document {
  std::vector<Session> sessions;
  // Unknown top-level members
  json extra = json::object();
};

inline json EncodeSession(const Session &s) {
  json rec = s.extra.is_object() ? s.extra : json::object();
  rec[kStartKey] = timeutil::FormatIso8601(s.start);
  rec[kEndKey] =
      s.end.has_value() ? json(timeutil::FormatIso8601(*s.end)) : json(nullptr);
  rec[kNoteKey] = s.note;
  return rec;
}

inline std::string Encode(const Document &doc) {
  json root = doc.extra.is_object() ? doc.extra : json::object();
  json arr = json::array();
  for (const auto &s : doc.sessions) {
    arr.push_back(EncodeSession(s));
  }
  root[kSessionsKey] = std::move(arr);
  // Notes arrive as raw bytes from argv or stdin; bytes that are not valid
  // UTF-8 are written as U+FFFD instead of failing the whole document
  return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

namespace detail {

inline std::unexpected<std::error_code> Corrupt(std::size_t index,
                                                std::string_view what) {
  logging::Warn("codec", "session record " + std::to_string(index) + ": " +
                             std::string(what));
  return tracker::Fail(Errc::storage_corrupt);
}

inline Result<timeutil::Instant> DecodeInstant(const json &v, std::size_t index,
                                               const char *key) {
  if (!v.is_string()) {
    return Corrupt(index, std::string(key) + " is not a string");
  }
  const auto &text = v.get_ref<const std::string &>();
  auto t = timeutil::ParseIso8601(text);
  if (!t) {
    return Corrupt(index, std::string(key) + " '" + text +
                              "' is not an ISO-8601 timestamp with UTC offset");
  }
  return *t;
}

} // namespace detail

inline Result<Session> DecodeSession(const json &rec, std::size_t index) {
  if (!rec.is_object()) {
    return detail::Corrupt(index, "record is not an object");
  }
  for (const char *key : {kStartKey, kEndKey, kNoteKey}) {
    if (!rec.contains(key)) {
      return detail::Corrupt(index, std::string("missing '") + key + "'");
    }
  }

  Session s;
  auto start = detail::DecodeInstant(rec.at(kStartKey), index, kStartKey);
  if (!start) {
    return std::unexpected(start.error());
  }
  s.start = *start;

  const auto &end = rec.at(kEndKey);
  if (!end.is_null()) {
    auto e = detail::DecodeInstant(end, index, kEndKey);
    if (!e) {
      return std::unexpected(e.error());
    }
    s.end = *e;
  }

  const auto &note = rec.at(kNoteKey);
  if (!note.is_string()) {
    return detail::Corrupt(index, "note is not a string");
  }
  s.note = note.get<std::string>();

  for (auto it = rec.begin(); it != rec.end(); ++it) {
    if (it.key() != kStartKey && it.key() != kEndKey && it.key() != kNoteKey) {
      s.extra[it.key()] = it.value();
    }
  }
  return s;
}

// Structural validation only: the single-running-session rule is checked by
// the store, which owns that invariant.
inline Result<Document> Decode(std::string_view text) {
  json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    logging::Warn("codec", "document is not valid JSON");
    return tracker::Fail(Errc::storage_corrupt);
  }
  if (!root.is_object()) {
    logging::Warn("codec", "document root is not an object");
    return tracker::Fail(Errc::storage_corrupt);
  }

  Document doc;
  for (auto it = root.begin(); it != root.end(); ++it) {
    if (it.key() != kSessionsKey) {
      doc.extra[it.key()] = it.value();
    }
  }
  if (!root.contains(kSessionsKey)) {
    return doc;
  }
  const auto &arr = root.at(kSessionsKey);
  if (!arr.is_array()) {
    logging::Warn("codec", "'sessions' is not an array");
    return tracker::Fail(Errc::storage_corrupt);
  }
  doc.sessions.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    auto s = DecodeSession(arr[i], i);
    if (!s) {
      return std::unexpected(s.error());
    }
    doc.sessions.push_back(std::move(*s));
  }
  return doc;
}

} // namespace store
