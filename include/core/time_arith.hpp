#pragma once

#include "core/session.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <span>

// namespace arith — pure duration and overlap arithmetic over a session list.
// No I/O and no mutation; every function takes the reference "now" explicitly.
namespace arith {

using timeutil::Instant;
using tracker::Session;

struct Totals {
  std::int64_t today = 0;
  std::int64_t all = 0;
};

// Whole seconds in [from, to); sub-second remainders are truncated and a
// reversed interval yields zero.
inline std::int64_t ClampedSeconds(timeutil::TimePoint from,
                                   timeutil::TimePoint to) {
  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
  return std::max<std::int64_t>(0, secs);
}

inline Instant EndOrNow(const Session &s, const Instant &now) {
  return s.end.value_or(now);
}

inline std::int64_t Duration(const Session &s, const Instant &now) {
  return ClampedSeconds(s.start.utc, EndOrNow(s, now).utc);
}

// Midnight of the instant's wall-clock day, in the instant's own offset.
inline Instant DayStart(const Instant &t) {
  const auto midnight_wall = std::chrono::floor<std::chrono::days>(t.Wall());
  return Instant{.utc = timeutil::TimePoint{midnight_wall} - t.offset,
                 .offset = t.offset};
}

// Seconds of [a_begin, a_end) that fall inside [b_begin, b_end)
inline std::int64_t OverlapSeconds(timeutil::TimePoint a_begin,
                                   timeutil::TimePoint a_end,
                                   timeutil::TimePoint b_begin,
                                   timeutil::TimePoint b_end) {
  return ClampedSeconds(std::max(a_begin, b_begin), std::min(a_end, b_end));
}

inline std::int64_t TotalSeconds(std::span<const Session> sessions,
                                 const Instant &now) {
  std::int64_t total = 0;
  for (const auto &s : sessions) {
    total += Duration(s, now);
  }
  return total;
}

// Interval overlap with today's window [DayStart(now), DayStart(now) + 24h),
// so a session crossing midnight only contributes its part inside today.
inline std::int64_t TodaySeconds(std::span<const Session> sessions,
                                 const Instant &now) {
  const auto today = DayStart(now).utc;
  const auto tomorrow = today + std::chrono::hours(24);
  std::int64_t total = 0;
  for (const auto &s : sessions) {
    total += OverlapSeconds(s.start.utc, EndOrNow(s, now).utc, today, tomorrow);
  }
  return total;
}

inline Totals ComputeTotals(std::span<const Session> sessions,
                            const Instant &now) {
  const auto today = DayStart(now).utc;
  const auto tomorrow = today + std::chrono::hours(24);
  Totals t;
  for (const auto &s : sessions) {
    const auto end = EndOrNow(s, now).utc;
    t.all += ClampedSeconds(s.start.utc, end);
    t.today += OverlapSeconds(s.start.utc, end, today, tomorrow);
  }
  return t;
}

} // namespace arith
