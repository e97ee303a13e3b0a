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

#include "core/cancel_token.hpp"
#include "core/collector.hpp"
#include "core/executor.hpp"
#include "core/progress.hpp"
#include "core/status.hpp"
#include "core/task.hpp"
#include "core/task_source.hpp"
#include "core/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace seqbuild::core {

struct DispatchCfg {
  TaskRange range;
  std::size_t concurrency = 1;
};

struct RunHooks {
  std::function<void(const ProgressSnapshot&)> on_progress; // empty: default progress log line
  std::function<void(const Outcome&)> on_failure;           // first failure only
};

struct RunReport {
  TaskRange range;
  std::size_t total = 0;
  RunState state;
  std::size_t dropped = 0;
  std::chrono::steady_clock::duration elapsed{};

  bool success() const noexcept { return state.done == total && state.succeeded == total; }
};

constexpr std::size_t task_queue_capacity(std::size_t concurrency) noexcept {
  return concurrency * 2 > 0 ? concurrency * 2 : 1;
}

// One producer, `concurrency` workers and the calling thread as collector.
//
// run() returns as soon as the verdict is known: on the first failure it does not wait for
// other in-flight tasks, whose outcomes are discarded. Those workers are joined when the
// Dispatcher is destroyed.
class Dispatcher {
public:
  Dispatcher(DispatchCfg cfg, Executor& exec, RunHooks hooks = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  Result<RunReport> run();

  // Safe from any thread, any number of times: no new task starts after this.
  void request_stop() noexcept;

  bool stop_requested() const noexcept { return cancel_.cancelled(); }

private:
  void shutdown_() noexcept;

  DispatchCfg cfg_;
  Executor& exec_;
  RunHooks hooks_;

  CancellationToken cancel_;
  TaskQueue tasks_;
  OutcomeQueue results_{OutcomeQueue::kUnbounded};

  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<TaskSource> source_;

  std::atomic_bool ran_{false};
};

} // namespace seqbuild::core
