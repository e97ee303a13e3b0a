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

#include "platform/posix-common/signal_shield.hpp"

#include <cstdlib>
#include <exception>
#include <utility>

#include <pthread.h>

#include <spdlog/spdlog.h>

namespace seqbuild::posix_common {

namespace {

// Internal wake-up, sent to the watcher thread only. Never counted as an interrupt.
constexpr int kWakeSignal = SIGUSR1;

sigset_t interrupt_set() {
  sigset_t set{};
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGHUP);
  sigaddset(&set, SIGQUIT);
  return set;
}

sigset_t blocked_set() {
  sigset_t set = interrupt_set();
  sigaddset(&set, kWakeSignal);
  return set;
}

const char* signal_name(int signo) {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    case SIGQUIT: return "SIGQUIT";
    default: return "signal";
  }
}

void watch(std::stop_token st, SignalShield::StopFn on_stop, int force_exit_after) {
  const sigset_t waitset = blocked_set();
  int count = 0;

  while (!st.stop_requested()) {
    int signo = 0;
    if (::sigwait(&waitset, &signo) != 0) continue;
    if (signo == kWakeSignal) continue;

    ++count;
    if (count >= force_exit_after) {
      spdlog::error("{} received {} times, exiting now", signal_name(signo), count);
      std::_Exit(128 + signo);
    }

    if (count == 1) {
      spdlog::warn("{} received, stopping after in-flight builds (repeat {} more time(s) to force exit)",
                   signal_name(signo), force_exit_after - count);
      if (on_stop) on_stop();
    } else {
      spdlog::warn("{} received again ({} more to force exit)", signal_name(signo), force_exit_after - count);
    }
  }
}

} // namespace

SignalShield::~SignalShield() { stop_and_restore_(); }

SignalShield::SignalShield(SignalShield&& o) noexcept { *this = std::move(o); }

SignalShield& SignalShield::operator=(SignalShield&& o) noexcept {
  if (this == &o) return *this;

  stop_and_restore_();

  watcher_ = std::move(o.watcher_);
  active_ = std::exchange(o.active_, false);
  old_mask_ = o.old_mask_;
  have_old_mask_ = std::exchange(o.have_old_mask_, false);
  return *this;
}

void SignalShield::stop_and_restore_() noexcept {
  if (active_) {
    watcher_.request_stop();
    (void)::pthread_kill(watcher_.native_handle(), kWakeSignal);
    if (watcher_.joinable()) watcher_.join();
    active_ = false;
  }

  if (have_old_mask_) {
    (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    have_old_mask_ = false;
  }
}

std::optional<SignalShield> SignalShield::enable(StopFn on_stop, int force_exit_after) {
  // Children get SIGPIPE back to default through their spawn attributes.
  ::signal(SIGPIPE, SIG_IGN);

  if (force_exit_after < 2) force_exit_after = 2;

  const sigset_t set = blocked_set();
  sigset_t old{};
  if (::pthread_sigmask(SIG_BLOCK, &set, &old) != 0) return std::nullopt;

  SignalShield sh;
  sh.old_mask_ = old;
  sh.have_old_mask_ = true;

  try {
    sh.watcher_ = std::jthread(watch, std::move(on_stop), force_exit_after);
  } catch (const std::exception& e) {
    spdlog::warn("cannot start signal watcher: {}", e.what());
    return std::nullopt;
  }
  sh.active_ = true;

  return std::optional<SignalShield>{std::move(sh)};
}

} // namespace seqbuild::posix_common
