#pragma once

#include "core/errors.hpp"
#include "core/session.hpp"
#include "io/file_writer.hpp"
#include "logging/log.hpp"
#include "store/session_codec.hpp"
#include "util/time.hpp"
#include <cerrno>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace store {

using tracker::SessionId;
using tracker::State;
using tracker::Status;

// SessionStore
// Ownership and threading model:
// - Sole owner of the in-memory session list and of the backing file
// - Every public call takes one mutex, so a reader never sees a list that is
//   halfway through start/stop/delete
// - Mutations are applied to a copy, the copy is persisted with an atomic
//   replace, and only then swapped in; a failed write leaves memory and disk
//   as they were
// - Idle/Running is derived from the list on demand, never stored
class SessionStore {
public:
  using NowFn = std::function<timeutil::Instant()>;

  explicit SessionStore(std::string path, NowFn now = timeutil::NowLocal)
      : path_(std::move(path)), now_(std::move(now)) {}

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  const std::string &Path() const { return path_; }

  // Reads the backing file, creating it with an empty collection when absent.
  // Replaces the in-memory collection only on success.
  Result<std::vector<Session>> Load() {
    std::lock_guard lock(mu_);
    if (auto st = io::EnsureParentDirectory(path_); !st) {
      return IoFailure("create directory for", st.error());
    }
    if (!io::Exists(path_)) {
      Document empty;
      if (auto st = io::AtomicReplace(path_, Encode(empty)); !st) {
        return IoFailure("initialize", st.error());
      }
      logging::Info("store", "initialized empty session file " + path_);
      sessions_.clear();
      extra_ = json::object();
      return sessions_;
    }

    auto text = io::ReadFile(path_);
    if (!text) {
      return IoFailure("read", text.error());
    }
    auto doc = Decode(*text);
    if (!doc) {
      logging::Error("store", path_ + " failed validation");
      return std::unexpected(doc.error());
    }
    if (auto st = Validate(doc->sessions); !st) {
      return std::unexpected(st.error());
    }
    // Ids keep counting across reloads so an id handed out earlier never
    // names a different session later
    for (auto &s : doc->sessions) {
      s.id = next_id_++;
    }
    sessions_ = std::move(doc->sessions);
    extra_ = std::move(doc->extra);
    logging::Debug("store", "loaded " + std::to_string(sessions_.size()) +
                                " session(s) from " + path_);
    return sessions_;
  }

  // Persists `sessions` as the full collection and adopts it in memory.
  // Sessions without an id get a fresh one.
  Status Save(std::vector<Session> sessions) {
    std::lock_guard lock(mu_);
    if (auto st = Validate(sessions); !st) {
      return st;
    }
    SessionId next = next_id_;
    for (auto &s : sessions) {
      if (s.id == 0) {
        s.id = next++;
      }
    }
    if (auto st = PersistLocked(sessions); !st) {
      return st;
    }
    next_id_ = next;
    sessions_ = std::move(sessions);
    return {};
  }

  Result<SessionId> Start(std::string note) {
    std::lock_guard lock(mu_);
    if (RunningIndexLocked().has_value()) {
      return tracker::Fail(Errc::already_running);
    }
    auto next = sessions_;
    Session s;
    s.id = next_id_;
    s.start = now_();
    s.note = std::move(note);
    next.push_back(std::move(s));
    if (auto st = PersistLocked(next); !st) {
      return std::unexpected(st.error());
    }
    sessions_ = std::move(next);
    logging::Debug("store", "started session #" + std::to_string(next_id_));
    return next_id_++;
  }

  Result<Session> Stop() {
    std::lock_guard lock(mu_);
    auto idx = RunningIndexLocked();
    if (!idx.has_value()) {
      return tracker::Fail(Errc::not_running);
    }
    return StopAtLocked(*idx);
  }

  // Quit-path helper: closes the running session if there is one
  Result<std::optional<Session>> StopIfRunning() {
    std::lock_guard lock(mu_);
    auto idx = RunningIndexLocked();
    if (!idx.has_value()) {
      return std::optional<Session>{};
    }
    auto closed = StopAtLocked(*idx);
    if (!closed) {
      return std::unexpected(closed.error());
    }
    return std::optional<Session>{std::move(*closed)};
  }

  // Removes sessions by identity; unknown ids are ignored. Returns the number
  // of sessions removed. Nothing is written when nothing matched.
  Result<std::size_t> Delete(const std::vector<SessionId> &ids) {
    std::lock_guard lock(mu_);
    const std::unordered_set<SessionId> doomed(ids.begin(), ids.end());
    auto next = sessions_;
    std::erase_if(next,
                  [&doomed](const Session &s) { return doomed.contains(s.id); });
    const std::size_t removed = sessions_.size() - next.size();
    if (removed == 0) {
      return removed;
    }
    if (auto st = PersistLocked(next); !st) {
      return std::unexpected(st.error());
    }
    sessions_ = std::move(next);
    logging::Debug("store", "deleted " + std::to_string(removed) +
                                " session(s)");
    return removed;
  }

  std::vector<Session> List() const {
    std::lock_guard lock(mu_);
    return sessions_;
  }

  std::optional<Session> Running() const {
    std::lock_guard lock(mu_);
    auto idx = RunningIndexLocked();
    if (!idx.has_value()) {
      return std::nullopt;
    }
    return sessions_[*idx];
  }

  State GetState() const {
    std::lock_guard lock(mu_);
    return RunningIndexLocked().has_value() ? State::running : State::idle;
  }

  bool IsRunning() const { return GetState() == State::running; }

private:
  std::optional<std::size_t> RunningIndexLocked() const {
    for (std::size_t i = sessions_.size(); i-- > 0;) {
      if (sessions_[i].IsRunning()) {
        return i;
      }
    }
    return std::nullopt;
  }

  Result<Session> StopAtLocked(std::size_t idx) {
    auto next = sessions_;
    next[idx].end = now_();
    if (auto st = PersistLocked(next); !st) {
      return std::unexpected(st.error());
    }
    sessions_ = std::move(next);
    logging::Debug("store",
                   "stopped session #" + std::to_string(sessions_[idx].id));
    return sessions_[idx];
  }

  // At most one open session; end-before-start is tolerated with a warning
  // because arithmetic clamps it.
  Status Validate(const std::vector<Session> &sessions) const {
    std::size_t open = 0;
    for (std::size_t i = 0; i < sessions.size(); ++i) {
      const auto &s = sessions[i];
      if (s.IsRunning()) {
        ++open;
      } else if (*s.end < s.start) {
        logging::Warn("store", "session record " + std::to_string(i) +
                                   " ends before it starts; counted as 0s");
      }
    }
    if (open > 1) {
      logging::Error("store", path_ + " holds " + std::to_string(open) +
                                  " running sessions");
      return tracker::Fail(Errc::storage_corrupt);
    }
    return {};
  }

  Status PersistLocked(const std::vector<Session> &sessions) {
    Document doc{.sessions = sessions, .extra = extra_};
    std::string text;
    try {
      text = Encode(doc);
    } catch (const json::exception &e) {
      logging::Error("store", "encode " + path_ + " failed: " + e.what());
      return tracker::Fail(Errc::storage_io);
    }
    if (auto st = io::AtomicReplace(path_, text); !st) {
      return IoFailure("write", st.error());
    }
    return {};
  }

  std::unexpected<std::error_code> IoFailure(const char *stage,
                                             const std::error_code &ec) const {
    logging::Error("store", std::string(stage) + " " + path_ +
                                " failed: " + ec.message());
    return tracker::Fail(Errc::storage_io);
  }

  std::string path_;
  NowFn now_;
  mutable std::mutex mu_;
  std::vector<Session> sessions_;
  json extra_ = json::object();
  SessionId next_id_ = 1;
};

// Moves a file that failed validation out of the way as
// <path>.corrupt-YYYYMMDD_HHMMSS so the next Load() starts empty. Only called
// when the application is configured for that recovery.
inline Result<std::string> ArchiveCorrupt(const std::string &path) {
  const std::string target =
      path + ".corrupt-" + timeutil::TimestampForFile();
  if (std::rename(path.c_str(), target.c_str()) != 0) {
    const std::error_code ec(errno, std::system_category());
    logging::Error("store",
                   "archive " + path + " failed: " + ec.message());
    return tracker::Fail(Errc::storage_io);
  }
  logging::Warn("store", "moved corrupt session file to " + target);
  return target;
}

} // namespace store
