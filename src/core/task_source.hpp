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
#include "core/task.hpp"
#include "core/worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <thread>

namespace seqbuild::core {

// Producer thread: feeds [range.start, range.end] in ascending order into `out`, then closes it.
class TaskSource {
public:
  TaskSource(TaskRange range, TaskQueue& out, CancellationToken& cancel);
  ~TaskSource();

  TaskSource(const TaskSource&) = delete;
  TaskSource& operator=(const TaskSource&) = delete;

  void join() noexcept;

  std::size_t emitted() const noexcept { return emitted_.load(std::memory_order_relaxed); }

private:
  void run_() noexcept;

  TaskRange range_;
  TaskQueue& out_;
  CancellationToken& cancel_;

  std::atomic<std::size_t> emitted_{0};
  std::thread thread_;
};

} // namespace seqbuild::core
