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

#include "platform/platform_all.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <thread>
#include <utility>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

using seqbuild::platform::SignalShield;
using namespace std::chrono_literals;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool cond) {
  if (cond) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

template <class Pred>
static bool wait_for(Pred p, std::chrono::milliseconds limit = 2000ms) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (!p()) {
    if (std::chrono::steady_clock::now() > until) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

static bool blocked_now(int signo) {
  sigset_t cur{};
  sigemptyset(&cur);
  pthread_sigmask(SIG_BLOCK, nullptr, &cur);
  return sigismember(&cur, signo) == 1;
}

static void test_first_interrupt_requests_stop_once() {
  std::atomic<int> stops{0};
  {
    auto sh = SignalShield::enable([&] { stops.fetch_add(1); });
    check("stop.enabled", sh.has_value() && sh->active());
    check("stop.blocked", blocked_now(SIGINT) && blocked_now(SIGTERM));

    ::kill(::getpid(), SIGINT);
    check("stop.first", wait_for([&] { return stops.load() == 1; }));

    // Second interrupt is below the force-exit threshold: logged, no second stop.
    ::kill(::getpid(), SIGTERM);
    std::this_thread::sleep_for(100ms);
    check("stop.once", stops.load() == 1);
  }
  check("stop.mask_restored", !blocked_now(SIGINT) && !blocked_now(SIGTERM));
}

static void test_teardown_without_signals() {
  std::atomic<int> stops{0};
  const auto t0 = std::chrono::steady_clock::now();
  {
    auto sh = SignalShield::enable([&] { stops.fetch_add(1); });
    check("idle.enabled", sh.has_value());
  }
  const auto took = std::chrono::steady_clock::now() - t0;
  check("idle.prompt_teardown", took < 1s);
  check("idle.no_stop", stops.load() == 0);
  check("idle.mask_restored", !blocked_now(SIGINT) && !blocked_now(SIGUSR1));

  // Nothing the teardown used to wake the watcher may still be pending.
  sigset_t pending{};
  sigemptyset(&pending);
  sigpending(&pending);
  check("idle.nothing_pending", !sigismember(&pending, SIGTERM) && !sigismember(&pending, SIGUSR1));
}

static void test_moved_shield_keeps_watching() {
  std::atomic<int> stops{0};
  {
    auto sh = SignalShield::enable([&] { stops.fetch_add(1); });
    SignalShield moved = std::move(*sh);
    sh.reset();
    check("move.still_blocked", blocked_now(SIGINT));
    check("move.active", moved.active());

    ::kill(::getpid(), SIGHUP);
    check("move.stop", wait_for([&] { return stops.load() == 1; }));
  }
  check("move.mask_restored", !blocked_now(SIGHUP));
}

static void test_repeated_interrupt_forces_exit() {
  const pid_t pid = ::fork();
  if (pid == 0) {
    auto sh = SignalShield::enable([] {}, 2);
    if (!sh) ::_exit(90);
    ::kill(::getpid(), SIGINT);
    ::usleep(100 * 1000);
    ::kill(::getpid(), SIGINT);
    ::usleep(2000 * 1000);
    ::_exit(91);
  }

  check("force.forked", pid > 0);
  if (pid <= 0) return;

  int status = 0;
  ::waitpid(pid, &status, 0);
  check("force.exited", WIFEXITED(status));
  check("force.code", WIFEXITED(status) && WEXITSTATUS(status) == 128 + SIGINT);
}

int main() {
  spdlog::set_level(spdlog::level::off);

  test_first_interrupt_requests_stop_once();
  test_teardown_without_signals();
  test_moved_shield_keeps_watching();
  test_repeated_interrupt_forces_exit();

  std::fprintf(stdout, "signal_shield: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
