#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace timeutil {

using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

// Instant: an absolute point in time together with the UTC offset of the wall
// clock it was observed on. Ordering and equality use the absolute time only;
// the offset decides which local day the instant belongs to.
struct Instant {
  TimePoint utc{};
  std::chrono::minutes offset{0};

  // Wall-clock reading expressed on the sys_time axis (utc shifted by offset)
  TimePoint Wall() const { return utc + offset; }

  friend bool operator==(const Instant &a, const Instant &b) {
    return a.utc == b.utc;
  }
  friend auto operator<=>(const Instant &a, const Instant &b) {
    return a.utc <=> b.utc;
  }
};

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

// Formats given std::tm using the provided strftime-like format string.
inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Formats current local time using the provided format string.
inline std::string NowLocalFormatted(const char *fmt) {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm = LocalTime(tt);
  return FormatTm(tm, fmt);
}

// Produces a compact timestamp suitable for filenames: YYYYMMDD_HHMMSS
inline std::string TimestampForFile() {
  return NowLocalFormatted("%Y%m%d_%H%M%S");
}

// Produces a human-friendly time for logs: HH:MM:SS
inline std::string ClockTime() { return NowLocalFormatted("%H:%M:%S"); }

// Current instant at second precision, tagged with the local UTC offset in
// effect right now (DST aware through the C library's zone rules).
inline Instant NowLocal() {
  const auto now =
      std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm = LocalTime(tt);
  std::chrono::minutes offset{0};
#if !defined(_WIN32)
  offset = std::chrono::duration_cast<std::chrono::minutes>(
      std::chrono::seconds(tm.tm_gmtoff));
#endif
  return Instant{.utc = TimePoint{now}, .offset = offset};
}

namespace detail {

template <typename Int>
inline bool ParseFixed(std::string_view s, std::size_t pos, std::size_t width,
                       Int &out) {
  if (pos + width > s.size()) {
    return false;
  }
  const char *first = s.data() + pos;
  const char *last = first + width;
  for (const char *p = first; p != last; ++p) {
    if (*p < '0' || *p > '9') {
      return false;
    }
  }
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

inline void AppendPadded(std::ostringstream &oss, long long v, int width) {
  oss << std::setw(width) << std::setfill('0') << v;
}

} // namespace detail

// Parses an ISO-8601 timestamp of the form
//   YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM|+HHMM|-HHMM)
// A space is accepted in place of 'T'. Fractions beyond microseconds are
// truncated. Returns nullopt for malformed input and for timestamps that carry
// no UTC offset.
inline std::optional<Instant> ParseIso8601(std::string_view s) {
  int y = 0;
  unsigned mo = 0, d = 0;
  int hh = 0, mm = 0, ss = 0;
  if (!detail::ParseFixed(s, 0, 4, y) || s.size() < 19 || s[4] != '-' ||
      !detail::ParseFixed(s, 5, 2, mo) || s[7] != '-' ||
      !detail::ParseFixed(s, 8, 2, d) || (s[10] != 'T' && s[10] != ' ') ||
      !detail::ParseFixed(s, 11, 2, hh) || s[13] != ':' ||
      !detail::ParseFixed(s, 14, 2, mm) || s[16] != ':' ||
      !detail::ParseFixed(s, 17, 2, ss)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 59) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{y},
                                        std::chrono::month{mo},
                                        std::chrono::day{d}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  std::int64_t micros = 0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
    ++pos;
    int digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (s[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 6; ++i) {
      micros *= 10;
    }
  }

  if (pos >= s.size()) {
    return std::nullopt; // naive timestamp
  }
  std::chrono::minutes offset{0};
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    const int sign = s[pos] == '-' ? -1 : 1;
    ++pos;
    int oh = 0, om = 0;
    if (!detail::ParseFixed(s, pos, 2, oh)) {
      return std::nullopt;
    }
    pos += 2;
    if (pos < s.size() && s[pos] == ':') {
      ++pos;
    }
    if (!detail::ParseFixed(s, pos, 2, om)) {
      return std::nullopt;
    }
    pos += 2;
    if (oh > 23 || om > 59) {
      return std::nullopt;
    }
    offset = std::chrono::minutes(sign * (oh * 60 + om));
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) {
    return std::nullopt;
  }

  const TimePoint wall = TimePoint{std::chrono::sys_days{ymd}} +
                         std::chrono::hours(hh) + std::chrono::minutes(mm) +
                         std::chrono::seconds(ss) +
                         std::chrono::microseconds(micros);
  return Instant{.utc = wall - offset, .offset = offset};
}

// Formats an instant as YYYY-MM-DDTHH:MM:SS+HH:MM in its own offset. Sub-second
// precision is dropped.
inline std::string FormatIso8601(const Instant &t) {
  const auto wall = std::chrono::floor<std::chrono::seconds>(t.Wall());
  const auto day = std::chrono::floor<std::chrono::days>(wall);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss hms{wall - day};

  std::ostringstream oss;
  detail::AppendPadded(oss, static_cast<int>(ymd.year()), 4);
  oss << '-';
  detail::AppendPadded(oss, static_cast<unsigned>(ymd.month()), 2);
  oss << '-';
  detail::AppendPadded(oss, static_cast<unsigned>(ymd.day()), 2);
  oss << 'T';
  detail::AppendPadded(oss, hms.hours().count(), 2);
  oss << ':';
  detail::AppendPadded(oss, hms.minutes().count(), 2);
  oss << ':';
  detail::AppendPadded(oss, hms.seconds().count(), 2);

  const auto off = t.offset.count();
  oss << (off < 0 ? '-' : '+');
  const auto abs_off = off < 0 ? -off : off;
  detail::AppendPadded(oss, abs_off / 60, 2);
  oss << ':';
  detail::AppendPadded(oss, abs_off % 60, 2);
  return oss.str();
}

// Human duration H:MM:SS; hours are not wrapped at 24. Negative input renders
// as zero.
inline std::string FormatDuration(std::int64_t seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  std::ostringstream oss;
  oss << seconds / 3600 << ':';
  detail::AppendPadded(oss, (seconds % 3600) / 60, 2);
  oss << ':';
  detail::AppendPadded(oss, seconds % 60, 2);
  return oss.str();
}

} // namespace timeutil
