#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

// Error kinds reported by the session engine. Every fallible engine call
// returns std::expected<T, std::error_code> carrying one of these; the
// underlying cause (errno, parser message) is logged where it happens.
namespace tracker {

enum class Errc {
  already_running = 1,
  not_running,
  storage_io,
  storage_corrupt,
};

class ErrorCategory final : public std::error_category {
public:
  const char *name() const noexcept override { return "timeclock"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::already_running:
      return "a session is already running";
    case Errc::not_running:
      return "no session is running";
    case Errc::storage_io:
      return "storage I/O error";
    case Errc::storage_corrupt:
      return "storage file is corrupt";
    }
    return "unknown error";
  }
};

inline const std::error_category &Category() {
  static const ErrorCategory category;
  return category;
}

inline std::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), Category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;
using Status = std::expected<void, std::error_code>;

inline std::unexpected<std::error_code> Fail(Errc e) {
  return std::unexpected(make_error_code(e));
}

} // namespace tracker

template <> struct std::is_error_code_enum<tracker::Errc> : std::true_type {};
