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

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace seqbuild::core {

struct ProgressSnapshot {
  std::size_t done = 0;
  std::size_t total = 0;
  std::size_t ok = 0;
  std::size_t failed = 0;
  double rate = 0.0; // tasks per second
  std::chrono::seconds eta{0};
  std::chrono::steady_clock::duration elapsed{};
};

std::string format_progress(const ProgressSnapshot& s);

// Throttled progress telemetry. Purely observational: nothing in the run consults it.
class ProgressReporter {
public:
  using Clock = std::chrono::steady_clock;
  using Sink = std::function<void(const ProgressSnapshot&)>;

  static constexpr std::chrono::milliseconds kDefaultInterval{1000};

  // An empty sink logs format_progress() at info level.
  explicit ProgressReporter(std::size_t total, Sink sink = {}, Clock::time_point start = Clock::now(),
                            Clock::duration interval = kDefaultInterval);

  // Emits when `interval` has passed since the last emission, or when done == total.
  bool update(std::size_t done, std::size_t ok, Clock::time_point now = Clock::now());

  static ProgressSnapshot snapshot(std::size_t total, std::size_t done, std::size_t ok, Clock::duration elapsed);

  Clock::time_point started() const noexcept { return start_; }
  std::size_t emissions() const noexcept { return emissions_; }

private:
  std::size_t total_;
  Sink sink_;
  Clock::time_point start_;
  Clock::time_point last_emit_;
  Clock::duration interval_;
  std::size_t emissions_ = 0;
};

} // namespace seqbuild::core
