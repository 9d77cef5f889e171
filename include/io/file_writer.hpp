#pragma once

#include "logging/log.hpp"
#include <cerrno>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <system_error>
#include <thread>
#include <unistd.h>

// namespace io — thin POSIX file helpers. Errors come back as
// std::error_code in the system category (errno values).
namespace io {

using Status = std::expected<void, std::error_code>;

inline std::error_code LastError() {
  return std::error_code(errno, std::system_category());
}

inline Status WriteAll(int fd, const char *data, std::size_t len) {
  const char *p = data;
  std::size_t remaining = len;
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return std::unexpected(LastError());
    }
    p += static_cast<std::size_t>(n);
    remaining -= static_cast<std::size_t>(n);
  }
  return {};
}

// Owns a file descriptor; closes it on scope exit.
class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  ~UniqueFd() { Reset(); }
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;
  UniqueFd(UniqueFd &&other) noexcept : fd_(other.Release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  int Get() const { return fd_; }
  bool Ok() const { return fd_ != -1; }

  int Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int fd = -1) {
    if (fd_ != -1) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  // Explicit close so that write-back errors reported by close(2) are seen
  Status Close() {
    int fd = Release();
    if (fd != -1 && ::close(fd) != 0) {
      return std::unexpected(LastError());
    }
    return {};
  }

private:
  int fd_;
};

inline std::expected<std::string, std::error_code>
ReadFile(const std::string &path) {
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.Ok()) {
    return std::unexpected(LastError());
  }
  std::string out;
  char buf[8192];
  for (;;) {
    ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(LastError());
    }
    if (n == 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

inline bool Exists(const std::string &path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0;
}

inline Status EnsureParentDirectory(const std::string &path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return {};
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline Status SyncDirectoryOf(const std::string &path) {
  auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  UniqueFd dir(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (!dir.Ok()) {
    return std::unexpected(LastError());
  }
  if (::fsync(dir.Get()) != 0) {
    return std::unexpected(LastError());
  }
  return {};
}

// Temporary sibling used by AtomicReplace
inline std::string TempPathFor(const std::string &path) {
  return path + ".tmp";
}

// AtomicReplace writes `content` to a temporary sibling, flushes it to disk
// and renames it over `path`. Readers of `path` see either the old or the new
// content, never a truncated file. On failure the temporary is removed and
// `path` is left as it was.
inline Status AtomicReplace(const std::string &path, std::string_view content) {
  const std::string tmp = TempPathFor(path);
  UniqueFd fd(
      ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd.Ok()) {
    return std::unexpected(LastError());
  }
  auto fail = [&tmp](std::error_code ec) -> Status {
    ::unlink(tmp.c_str());
    return std::unexpected(ec);
  };
  if (auto st = WriteAll(fd.Get(), content.data(), content.size()); !st) {
    fd.Reset();
    return fail(st.error());
  }
  if (::fsync(fd.Get()) != 0) {
    auto ec = LastError();
    fd.Reset();
    return fail(ec);
  }
  if (auto st = fd.Close(); !st) {
    return fail(st.error());
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    return fail(LastError());
  }
  // The new content is in place at this point; a failed directory sync only
  // weakens durability of the rename itself.
  if (auto st = SyncDirectoryOf(path); !st) {
    logging::Warn("io", "fsync of directory for " + path +
                            " failed: " + st.error().message());
  }
  return {};
}

} // namespace io
