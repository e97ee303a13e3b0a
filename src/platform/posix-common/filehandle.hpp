/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstring>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

namespace seqbuild {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  bool valid() const noexcept { return fd >= 0; }

  // Retries on EINTR. 0 means EOF.
  ssize_t read(void* buf, std::size_t count) const noexcept {
    for (;;) {
      const ssize_t rc = ::read(fd, buf, count);
      if (rc >= 0) return rc;
      if (errno == EINTR) continue;
      const int e = errno;
      spdlog::debug("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
      return rc;
    }
  }

  // Both ends are close-on-exec; returns false with errno set on failure.
  // Without pipe2 the close-on-exec flag is set after creation, so a concurrent spawn can
  // still inherit the fds. Callers that spawn from several threads must serialize the two.
  static constexpr bool kAtomicCloexecPipe =
#if defined(__linux__)
      true;
#else
      false;
#endif

  static bool make_pipe(FileHandle& rd, FileHandle& wr) noexcept {
    int fds[2] = {-1, -1};
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    rd = FileHandle(fds[0]);
    wr = FileHandle(fds[1]);
#else
    if (::pipe(fds) != 0) return false;
    rd = FileHandle(fds[0]);
    wr = FileHandle(fds[1]);
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
      const int e = errno;
      rd.close();
      wr.close();
      errno = e;
      return false;
    }
#endif
    return true;
  }
};

} // namespace seqbuild
