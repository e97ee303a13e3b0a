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

#include "core/task_source.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace seqbuild::core {

TaskSource::TaskSource(TaskRange range, TaskQueue& out, CancellationToken& cancel)
    : range_(range), out_(out), cancel_(cancel) {
  thread_ = std::thread([this] { run_(); });
}

TaskSource::~TaskSource() { join(); }

void TaskSource::join() noexcept {
  if (thread_.joinable()) thread_.join();
}

void TaskSource::run_() noexcept {
  try {
    for (TaskId n = range_.start; range_.valid() && n <= range_.end; ++n) {
      if (cancel_.cancelled()) {
        spdlog::debug("producer: cancelled before {}", task_label(n));
        break;
      }
      if (!out_.push(n)) {
        spdlog::debug("producer: task queue closed before {}", task_label(n));
        break;
      }
      emitted_.fetch_add(1, std::memory_order_relaxed);
      if (n == range_.end) break;
    }
  } catch (const std::exception& e) {
    spdlog::error("producer fatal error: {}", e.what());
    cancel_.request_cancel();
  }

  out_.close();
}

} // namespace seqbuild::core
