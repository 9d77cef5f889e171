#pragma once

#include "util/time.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tracker {

using SessionId = std::uint64_t;

// Session — one half-open work interval [start, end). A missing end means the
// session is still running. `id` is assigned by the store when the session
// enters its collection; a store never reuses an id, even across reloads.
struct Session {
  SessionId id = 0;
  timeutil::Instant start;
  std::optional<timeutil::Instant> end;
  std::string note;
  // Fields of the persisted record this version does not interpret; written
  // back untouched.
  nlohmann::json extra = nlohmann::json::object();

  bool IsRunning() const { return !end.has_value(); }
};

enum class State { idle, running };

} // namespace tracker
