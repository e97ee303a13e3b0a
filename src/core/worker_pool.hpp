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

#include "core/bounded_queue.hpp"
#include "core/cancel_token.hpp"
#include "core/executor.hpp"
#include "core/task.hpp"

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace seqbuild::core {

using TaskQueue = BoundedQueue<TaskId>;
using OutcomeQueue = BoundedQueue<Outcome>;

// Fixed set of workers pulling task ids from `tasks` and pushing one Outcome per executed task
// into `results`. The first failing worker cancels the run and closes `tasks`; the last worker
// to exit closes `results`.
class WorkerPool {
public:
  WorkerPool(std::size_t concurrency, Executor& exec, TaskQueue& tasks, OutcomeQueue& results,
             CancellationToken& cancel);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void join() noexcept;

  std::size_t size() const noexcept { return workers_.size(); }
  std::size_t live() const noexcept { return live_.load(std::memory_order_relaxed); }
  std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
  void worker_loop_(std::size_t idx) noexcept;
  ExecResult execute_(TaskId n) noexcept;
  void worker_exit_(std::size_t idx) noexcept;

private:
  Executor& exec_;
  TaskQueue& tasks_;
  OutcomeQueue& results_;
  CancellationToken& cancel_;

  std::atomic<std::size_t> live_{0};
  std::atomic<std::size_t> dropped_{0};

  std::vector<std::thread> workers_;
};

} // namespace seqbuild::core
