#pragma once

#include "app/options.hpp"
#include "control/command.hpp"
#include "control/notifier.hpp"
#include "core/errors.hpp"
#include "core/export_rows.hpp"
#include "core/time_arith.hpp"
#include "logging/log.hpp"
#include "store/session_store.hpp"
#include "util/time.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <chrono>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Application composition/threading overview:
// - SessionStore: owned by the main thread for the whole run
// - One-shot commands (start/stop/toggle/status/list/delete): main thread only
// - watch: main thread ticks every tick_ms, drains the command queue, applies
//   each command to the store, then redraws the status line
// - Notifier: dedicated jthread reading stdin; sole producer to the SPSC
//   command queue, never calls the store
namespace app {

enum ExitCode : int {
  kExitOk = 0,
  kExitUsage = 1,
  kExitState = 2,
  kExitStorage = 3,
};

inline int ExitCodeFor(const std::error_code &ec) {
  if (ec == tracker::Errc::already_running || ec == tracker::Errc::not_running) {
    return kExitState;
  }
  return kExitStorage;
}

inline int ReportError(const std::error_code &ec) {
  std::cerr << "timeclock: " << ec.message() << "\n";
  return ExitCodeFor(ec);
}

inline std::string JoinNote(const std::vector<std::string> &words) {
  return boost::algorithm::trim_copy(boost::algorithm::join(words, " "));
}

// Load with the configured recovery policy for a corrupt file
inline tracker::Status OpenStore(store::SessionStore &st,
                                 CorruptPolicy policy) {
  auto loaded = st.Load();
  if (loaded) {
    return {};
  }
  if (loaded.error() != tracker::Errc::storage_corrupt ||
      policy != CorruptPolicy::archive) {
    return std::unexpected(loaded.error());
  }
  auto archived = store::ArchiveCorrupt(st.Path());
  if (!archived) {
    return std::unexpected(archived.error());
  }
  auto fresh = st.Load();
  if (!fresh) {
    return std::unexpected(fresh.error());
  }
  return {};
}

inline std::string StatusLine(const std::vector<tracker::Session> &sessions,
                              const timeutil::Instant &now) {
  std::string state = "Not running";
  for (const auto &s : sessions) {
    if (s.IsRunning()) {
      state = "Running #" + std::to_string(s.id) + " (" +
              timeutil::FormatDuration(arith::Duration(s, now)) + ")";
      if (!s.note.empty()) {
        state += " " + s.note;
      }
    }
  }
  const auto totals = arith::ComputeTotals(sessions, now);
  return state + " | Today " + timeutil::FormatDuration(totals.today) +
         " | All-time " + timeutil::FormatDuration(totals.all);
}

inline void PrintList(std::ostream &out,
                      const std::vector<tracker::Session> &sessions,
                      const timeutil::Instant &now) {
  for (const auto &row : arith::ExportRows(sessions, now)) {
    out << '#' << row.id << "  " << row.start << "  "
        << (row.end.empty() ? std::string("running") : row.end) << "  "
        << (row.duration_seconds
                ? timeutil::FormatDuration(*row.duration_seconds)
                : std::string("-"))
        << "  " << row.note << "\n";
  }
}

inline int CmdStart(store::SessionStore &st, const std::string &note) {
  auto id = st.Start(note);
  if (!id) {
    return ReportError(id.error());
  }
  std::cout << "Started #" << *id << "\n";
  return kExitOk;
}

inline int CmdStop(store::SessionStore &st) {
  auto closed = st.Stop();
  if (!closed) {
    return ReportError(closed.error());
  }
  std::cout << "Stopped #" << closed->id << " ("
            << timeutil::FormatDuration(
                   arith::Duration(*closed, timeutil::NowLocal()))
            << ")\n";
  return kExitOk;
}

inline int CmdDelete(store::SessionStore &st,
                     const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "timeclock: delete needs at least one session id\n";
    return kExitUsage;
  }
  std::vector<tracker::SessionId> ids;
  for (const auto &a : args) {
    std::string_view sv = a;
    if (!sv.empty() && sv.front() == '#') {
      sv.remove_prefix(1);
    }
    tracker::SessionId id = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), id);
    if (ec != std::errc() || ptr != sv.data() + sv.size() || id == 0) {
      std::cerr << "timeclock: invalid session id '" << a << "'\n";
      return kExitUsage;
    }
    ids.push_back(id);
  }
  auto removed = st.Delete(ids);
  if (!removed) {
    return ReportError(removed.error());
  }
  std::cout << "Deleted " << *removed << " session(s)\n";
  return kExitOk;
}

// Applies one queued command on the engine thread. Failures are reported and
// the loop keeps running; returns false when the loop should end.
inline bool ApplyCommand(store::SessionStore &st,
                         const control::Command &cmd) {
  using control::CommandKind;
  tracker::Status result;
  switch (cmd.kind) {
  case CommandKind::refresh:
    return true;
  case CommandKind::quit:
    return false;
  case CommandKind::toggle:
    if (st.IsRunning()) {
      if (auto r = st.Stop(); !r) {
        result = std::unexpected(r.error());
      }
    } else if (auto r = st.Start(cmd.note); !r) {
      result = std::unexpected(r.error());
    }
    break;
  case CommandKind::start:
    if (auto r = st.Start(cmd.note); !r) {
      result = std::unexpected(r.error());
    }
    break;
  case CommandKind::stop:
    if (auto r = st.Stop(); !r) {
      result = std::unexpected(r.error());
    }
    break;
  }
  if (!result) {
    std::cout << "\n" << "! " << result.error().message() << "\n";
  }
  return true;
}

// Stops a running session on the way out, as closing the app always has
inline int Shutdown(store::SessionStore &st) {
  auto closed = st.StopIfRunning();
  if (!closed) {
    return ReportError(closed.error());
  }
  if (closed->has_value()) {
    std::cout << "Stopped #" << (*closed)->id << " on exit\n";
  }
  return kExitOk;
}

inline int CmdWatch(store::SessionStore &st, const Options &opt) {
  auto queue = std::make_shared<control::CommandQueue>();
  control::Notifier notifier(STDIN_FILENO, queue);
  notifier.Start();

  const auto period = std::chrono::milliseconds(opt.tick_ms);
  auto next_tick = std::chrono::steady_clock::now();
  bool keep_running = true;
  while (keep_running) {
    control::Command cmd;
    while (keep_running && queue->pop(cmd)) {
      keep_running = ApplyCommand(st, cmd);
    }
    std::cout << "\r\033[K" << StatusLine(st.List(), timeutil::NowLocal())
              << std::flush;
    if (!keep_running) {
      break;
    }
    next_tick += period;
    const auto now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      next_tick = now + period;
    }
    // Sleep in short slices so typed commands are applied promptly
    while (std::chrono::steady_clock::now() < next_tick &&
           queue->read_available() == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
  std::cout << "\n";
  notifier.Join();
  return Shutdown(st);
}

inline int Run(const Options &opt) {
  logging::SetLevel(opt.verbose ? logging::Level::debug : logging::Level::info);
  if (opt.help) {
    std::cout << Usage();
    return kExitOk;
  }

  store::SessionStore st(opt.data_file);
  if (auto opened = OpenStore(st, opt.on_corrupt); !opened) {
    return ReportError(opened.error());
  }

  const std::string &cmd = opt.command;
  if (cmd == "start") {
    return CmdStart(st, JoinNote(opt.args));
  }
  if (cmd == "stop") {
    return CmdStop(st);
  }
  if (cmd == "toggle") {
    return st.IsRunning() ? CmdStop(st) : CmdStart(st, JoinNote(opt.args));
  }
  if (cmd == "status") {
    std::cout << StatusLine(st.List(), timeutil::NowLocal()) << "\n";
    return kExitOk;
  }
  if (cmd == "list") {
    PrintList(std::cout, st.List(), timeutil::NowLocal());
    return kExitOk;
  }
  if (cmd == "delete") {
    return CmdDelete(st, opt.args);
  }
  if (cmd == "watch") {
    return CmdWatch(st, opt);
  }
  std::cerr << "timeclock: unknown command '" << cmd << "'\n" << Usage();
  return kExitUsage;
}

} // namespace app
