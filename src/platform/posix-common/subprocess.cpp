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

#include "platform/posix-common/subprocess.hpp"

#include "core/str.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace seqbuild::posix_common {

namespace {

struct SpawnActions {
  posix_spawn_file_actions_t fa{};
  bool live = false;

  SpawnActions() { live = ::posix_spawn_file_actions_init(&fa) == 0; }
  ~SpawnActions() { if (live) ::posix_spawn_file_actions_destroy(&fa); }

  SpawnActions(const SpawnActions&) = delete;
  SpawnActions& operator=(const SpawnActions&) = delete;
};

struct SpawnAttr {
  posix_spawnattr_t attr{};
  bool live = false;

  SpawnAttr() { live = ::posix_spawnattr_init(&attr) == 0; }
  ~SpawnAttr() { if (live) ::posix_spawnattr_destroy(&attr); }

  SpawnAttr(const SpawnAttr&) = delete;
  SpawnAttr& operator=(const SpawnAttr&) = delete;
};

// The parent may block terminal signals on every thread and ignore SIGPIPE; the child must not
// inherit either.
int reset_child_signals(posix_spawnattr_t& attr) noexcept {
  sigset_t empty{};
  sigemptyset(&empty);
  if (int rc = ::posix_spawnattr_setsigmask(&attr, &empty)) return rc;

  sigset_t defaults{};
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGTERM);
  sigaddset(&defaults, SIGHUP);
  sigaddset(&defaults, SIGQUIT);
  if (int rc = ::posix_spawnattr_setsigdefault(&attr, &defaults)) return rc;

  return ::posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
}

void keep_tail(std::string& acc, const char* data, std::size_t n, std::size_t max_bytes) {
  acc.append(data, n);
  if (acc.size() > 2 * max_bytes) acc.erase(0, acc.size() - max_bytes);
}

// Held from pipe creation until the write end is closed wherever pipes are not created
// close-on-exec atomically, so no child spawned by another worker inherits them.
std::mutex g_spawn_mutex;

int wait_child(pid_t pid, int& status) noexcept {
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) return 0;
    if (r < 0 && errno == EINTR) continue;
    return errno;
  }
}

} // namespace

core::Result<ProcessExit> run_process(const SpawnSpec& spec) noexcept {
  using R = core::Result<ProcessExit>;

  if (spec.argv.empty()) return R::Fail("spawn failed: empty command");

  try {
    std::unique_lock spawn_lk(g_spawn_mutex, std::defer_lock);
    if (!FileHandle::kAtomicCloexecPipe) spawn_lk.lock();

    FileHandle err_rd, err_wr;
    if (!FileHandle::make_pipe(err_rd, err_wr)) return R::Failf("spawn failed: pipe: {}", std::strerror(errno));

    SpawnActions actions;
    SpawnAttr attr;
    if (!actions.live || !attr.live) return R::Fail("spawn failed: cannot initialise spawn attributes");

    int rc = ::posix_spawn_file_actions_addopen(&actions.fa, 0, "/dev/null", O_RDONLY, 0);
    if (!rc && spec.silence_stdout) rc = ::posix_spawn_file_actions_addopen(&actions.fa, 1, "/dev/null", O_WRONLY, 0);
    if (!rc) rc = ::posix_spawn_file_actions_adddup2(&actions.fa, err_wr.fd, 2);
    if (!rc) rc = reset_child_signals(attr.attr);
    if (rc) return R::Failf("spawn failed: {}", std::strerror(rc));

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = -1;
    rc = ::posix_spawnp(&pid, argv[0], &actions.fa, &attr.attr, argv.data(), environ);
    err_wr.close();
    if (spawn_lk.owns_lock()) spawn_lk.unlock();
    if (rc) return R::Failf("spawn failed: {}: {}", spec.argv[0], std::strerror(rc));

    spdlog::debug("spawned pid {}: {}", pid, fmt::join(spec.argv, " "));

    ProcessExit out;
    std::array<char, 4096> buf{};
    for (;;) {
      const ssize_t n = err_rd.read(buf.data(), buf.size());
      if (n <= 0) break;
      keep_tail(out.stderr_tail, buf.data(), static_cast<std::size_t>(n), spec.stderr_tail_bytes);
    }
    err_rd.close();
    out.stderr_tail = core::tail_bytes(out.stderr_tail, spec.stderr_tail_bytes);

    int status = 0;
    if (int e = wait_child(pid, status)) return R::Failf("waitpid({}) failed: {}", pid, std::strerror(e));

    if (WIFEXITED(status)) {
      out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      out.term_signal = WTERMSIG(status);
    }
    return R::Ok(std::move(out));
  } catch (const std::exception& e) {
    return R::Failf("spawn failed: {}", e.what());
  }
}

} // namespace seqbuild::posix_common
