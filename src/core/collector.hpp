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

#include "core/progress.hpp"
#include "core/task.hpp"
#include "core/worker_pool.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace seqbuild::core {

struct RunState {
  std::size_t done = 0;
  std::size_t succeeded = 0;
  std::optional<Outcome> first_failure;
  bool cancelled = false;
};

class ResultCollector {
public:
  using FailureHook = std::function<void(const Outcome&)>;

  ResultCollector(std::size_t total, OutcomeQueue& results, ProgressReporter& progress, FailureHook on_failure = {});

  ResultCollector(const ResultCollector&) = delete;
  ResultCollector& operator=(const ResultCollector&) = delete;

  // Consumes outcomes until the channel closes or the first failure has been recorded.
  // Outcomes still queued after that failure are left unread.
  void collect();

  // Applies one outcome. Returns false once consumption should stop.
  bool accept(Outcome o);

  const RunState& state() const noexcept { return st_; }
  RunState& state() noexcept { return st_; }

private:
  std::size_t total_;
  OutcomeQueue& results_;
  ProgressReporter& progress_;
  FailureHook on_failure_;
  RunState st_;
};

} // namespace seqbuild::core
