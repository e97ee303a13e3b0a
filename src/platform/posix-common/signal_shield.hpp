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

#include <functional>
#include <optional>
#include <thread>

#include <signal.h>

namespace seqbuild::posix_common {

// Turns operator interrupts (SIGINT/SIGTERM/SIGHUP/SIGQUIT) into a graceful stop.
//
// The signals are blocked on the calling thread, and on every thread it starts afterwards, so
// enable() must run before the workers are spawned. A watcher thread collects them with sigwait:
// the first one calls `on_stop` once, and the `force_exit_after`-th one terminates the process
// with 128 + signo without waiting for anything.
class SignalShield {
public:
  using StopFn = std::function<void()>;

  static constexpr int kDefaultForceExitAfter = 3;

  SignalShield() = default;
  ~SignalShield();

  SignalShield(const SignalShield&) = delete;
  SignalShield& operator=(const SignalShield&) = delete;

  SignalShield(SignalShield&& o) noexcept;
  SignalShield& operator=(SignalShield&& o) noexcept;

  static std::optional<SignalShield> enable(StopFn on_stop, int force_exit_after = kDefaultForceExitAfter);

  bool active() const noexcept { return active_; }

private:
  void stop_and_restore_() noexcept;

  std::jthread watcher_{};
  bool active_ = false;

  sigset_t old_mask_{};
  bool have_old_mask_ = false;
};

} // namespace seqbuild::posix_common
