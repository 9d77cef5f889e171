#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lockfree/spsc_queue.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace control {

enum class CommandKind { toggle, start, stop, refresh, quit };

// Request sent from a notifier (input thread) to the engine-owning thread
struct Command {
  CommandKind kind = CommandKind::refresh;
  std::string note;
};

inline constexpr std::size_t kCommandQueueCapacity = 64;

// Single producer (notifier), single consumer (engine loop)
using CommandQueue = boost::lockfree::spsc_queue<
    Command, boost::lockfree::capacity<kCommandQueueCapacity>>;

// Parses one line typed in watch mode:
//   t | toggle [note]   s | start [note]   x | stop   q | quit   "" -> refresh
inline std::optional<Command> ParseCommandLine(std::string_view line) {
  std::string text = boost::algorithm::trim_copy(std::string(line));
  if (text.empty()) {
    return Command{.kind = CommandKind::refresh};
  }
  std::string word = text;
  std::string rest;
  auto space = text.find_first_of(" \t");
  if (space != std::string::npos) {
    word = text.substr(0, space);
    rest = boost::algorithm::trim_copy(text.substr(space + 1));
  }
  auto is = [&word](const char *a, const char *b) {
    return boost::algorithm::iequals(word, a) ||
           boost::algorithm::iequals(word, b);
  };
  if (is("t", "toggle")) {
    return Command{.kind = CommandKind::toggle, .note = rest};
  }
  if (is("s", "start")) {
    return Command{.kind = CommandKind::start, .note = rest};
  }
  if (rest.empty() && is("x", "stop")) {
    return Command{.kind = CommandKind::stop};
  }
  if (rest.empty() && is("q", "quit")) {
    return Command{.kind = CommandKind::quit};
  }
  return std::nullopt;
}

} // namespace control
