#pragma once

#include "control/command.hpp"
#include "logging/log.hpp"
#include <atomic>
#include <cerrno>
#include <memory>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace control {

// Notifier
// Threading model:
// - Owns one background std::jthread (started via Start) that reads command
//   lines from a file descriptor and pushes them onto the shared SPSC queue
// - The notifier is the queue's only producer; it never touches the session
//   store, the engine loop consumes and applies every command
// - The worker polls with a short timeout so a stop request is observed even
//   when no input arrives; Join() stops and waits for it
// - End of input is reported as a quit command so the loop can shut down
class Notifier {
public:
  Notifier(int fd, std::shared_ptr<CommandQueue> queue)
      : fd_(fd), queue_(std::move(queue)) {}

  ~Notifier() { Join(); }

  Notifier(const Notifier &) = delete;
  Notifier &operator=(const Notifier &) = delete;

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this](std::stop_token st) { this->Run(st); });
  }

  void Join() {
    if (worker_.joinable()) {
      worker_.request_stop();
      worker_.join();
    }
    running_.store(false);
  }

  // Number of commands dropped because the queue was full
  std::size_t Dropped() const { return dropped_.load(); }

private:
  static constexpr int kPollTimeoutMs = 200;
  // A partial line longer than this is dropped up to its next newline
  static constexpr std::size_t kMaxLineBytes = 4096;

  void Run(std::stop_token st) {
    std::string pending;
    bool discarding = false;
    char buf[256];
    while (!st.stop_requested()) {
      pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
      int rc = ::poll(&pfd, 1, kPollTimeoutMs);
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        logging::Error("notifier", "poll failed, closing input");
        Push(Command{.kind = CommandKind::quit});
        return;
      }
      if (rc == 0) {
        continue;
      }
      ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        logging::Error("notifier", "read failed, closing input");
        Push(Command{.kind = CommandKind::quit});
        return;
      }
      if (n == 0) {
        logging::Debug("notifier", "end of input");
        Push(Command{.kind = CommandKind::quit});
        return;
      }
      pending.append(buf, static_cast<std::size_t>(n));
      std::size_t nl;
      while ((nl = pending.find('\n')) != std::string::npos) {
        const std::string line = pending.substr(0, nl);
        pending.erase(0, nl + 1);
        if (discarding) {
          discarding = false;
          continue;
        }
        if (auto cmd = ParseCommandLine(line)) {
          Push(std::move(*cmd));
        } else {
          logging::Warn("notifier", "unknown command '" + line + "'");
        }
      }
      if (pending.size() > kMaxLineBytes) {
        if (!discarding) {
          logging::Warn("notifier", "input line exceeds " +
                                        std::to_string(kMaxLineBytes) +
                                        " bytes, discarding it");
          discarding = true;
        }
        pending.clear();
      }
    }
  }

  void Push(Command cmd) {
    if (!queue_->push(cmd)) {
      dropped_.fetch_add(1);
      logging::Warn("notifier", "command queue full, dropping command");
    }
  }

  int fd_;
  std::shared_ptr<CommandQueue> queue_;
  std::jthread worker_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> dropped_{0};
};

} // namespace control
