#pragma once

#include "core/session.hpp"
#include "core/time_arith.hpp"
#include "util/time.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace arith {

// One export row per session. Duration is left empty while the session is
// still running; rendering (CSV, table) belongs to the caller.
struct ExportRow {
  tracker::SessionId id = 0;
  std::string start;
  std::string end;
  std::optional<std::int64_t> duration_seconds;
  std::string note;
};

inline std::vector<ExportRow> ExportRows(std::span<const Session> sessions,
                                         const Instant &now) {
  std::vector<ExportRow> rows;
  rows.reserve(sessions.size());
  for (const auto &s : sessions) {
    ExportRow row;
    row.id = s.id;
    row.start = timeutil::FormatIso8601(s.start);
    if (s.end.has_value()) {
      row.end = timeutil::FormatIso8601(*s.end);
      row.duration_seconds = Duration(s, now);
    }
    row.note = s.note;
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace arith
