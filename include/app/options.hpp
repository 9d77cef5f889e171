#pragma once

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace app {

// What to do when the session file exists but fails validation
enum class CorruptPolicy { fail, archive };

struct Options {
  std::string command = "status";
  std::vector<std::string> args;
  std::string data_file;
  CorruptPolicy on_corrupt = CorruptPolicy::fail;
  int tick_ms = 1000;
  bool verbose = false;
  bool help = false;
};

inline constexpr const char *kDataFileEnv = "TIMECLOCK_FILE";

// $TIMECLOCK_FILE, else $HOME/.timeclock/sessions.json, else a file in the
// working directory
inline std::string DefaultDataFile() {
  if (const char *env = std::getenv(kDataFileEnv); env && *env) {
    return env;
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return std::string(home) + "/.timeclock/sessions.json";
  }
  return ".timeclock/sessions.json";
}

inline std::optional<CorruptPolicy> ParseCorruptPolicy(const std::string &s) {
  if (s == "fail") {
    return CorruptPolicy::fail;
  }
  if (s == "archive") {
    return CorruptPolicy::archive;
  }
  return std::nullopt;
}

inline const char *Usage() {
  return "usage: timeclock [options] <command> [args]\n"
         "\n"
         "commands:\n"
         "  start [note...]   start a session\n"
         "  stop              stop the running session\n"
         "  toggle [note...]  start or stop\n"
         "  status            show state and totals (default)\n"
         "  list              list sessions with ids\n"
         "  delete <id>...    delete sessions by id\n"
         "  watch             live view; type t/s/x/q + Enter\n"
         "\n"
         "options:\n"
         "  -f, --file <path>          session file\n"
         "      --on-corrupt <policy>  fail | archive (default fail)\n"
         "  -t, --tick <ms>            watch refresh period (default 1000)\n"
         "  -v, --verbose              debug logging\n"
         "  -h, --help                 this text\n";
}

// Returns nullopt on a usage error. Options are accepted before and after the
// command word; everything else after the command is an argument.
inline std::optional<Options> ParseArgs(int argc, char **argv) {
  Options opt;
  bool have_command = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-f" || a == "--file") && i + 1 < argc)
      opt.data_file = argv[++i];
    else if (a == "--on-corrupt" && i + 1 < argc) {
      auto policy = ParseCorruptPolicy(argv[++i]);
      if (!policy)
        return std::nullopt;
      opt.on_corrupt = *policy;
    } else if ((a == "-t" || a == "--tick") && i + 1 < argc)
      opt.tick_ms = std::max(50, std::atoi(argv[++i]));
    else if (a == "-v" || a == "--verbose")
      opt.verbose = true;
    else if (a == "-h" || a == "--help")
      opt.help = true;
    else if (a == "--")
      for (++i; i < argc; ++i)
        opt.args.emplace_back(argv[i]);
    else if (a.size() > 1 && a[0] == '-')
      return std::nullopt;
    else if (!have_command) {
      opt.command = a;
      have_command = true;
    } else
      opt.args.push_back(a);
  }
  if (opt.data_file.empty()) {
    opt.data_file = DefaultDataFile();
  }
  return opt;
}

} // namespace app
