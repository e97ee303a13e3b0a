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

#include "core/worker_pool.hpp"

#include "core/str.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace seqbuild::core {

WorkerPool::WorkerPool(std::size_t concurrency, Executor& exec, TaskQueue& tasks, OutcomeQueue& results,
                       CancellationToken& cancel)
    : exec_(exec), tasks_(tasks), results_(results), cancel_(cancel) {
  if (concurrency == 0) concurrency = 1;

  // Published before any thread runs so an early exit cannot close `results` too soon.
  live_.store(concurrency, std::memory_order_relaxed);
  workers_.reserve(concurrency);

  try {
    for (std::size_t i = 0; i < concurrency; ++i) workers_.emplace_back([this, i] { worker_loop_(i); });
  } catch (const std::exception& e) {
    spdlog::error("WorkerPool: failed to start worker {}: {}", workers_.size(), e.what());
    cancel_.request_cancel();
    tasks_.close();
    if (live_.fetch_sub(concurrency - workers_.size(), std::memory_order_acq_rel) == concurrency - workers_.size())
      results_.close();
    join();
    throw;
  }
}

WorkerPool::~WorkerPool() { join(); }

void WorkerPool::join() noexcept {
  for (auto& t : workers_) if (t.joinable()) t.join();
}

ExecResult WorkerPool::execute_(TaskId n) noexcept {
  try {
    return exec_.run(n);
  } catch (const std::exception& e) {
    return ExecResult::Fail(fmt::format("executor error: {}", e.what()));
  } catch (...) {
    return ExecResult::Fail("executor error: unknown exception");
  }
}

void WorkerPool::worker_exit_(std::size_t idx) noexcept {
  spdlog::debug("worker {} exiting", idx);
  if (live_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    spdlog::debug("last worker exited, closing result channel");
    results_.close();
  }
}

void WorkerPool::worker_loop_(std::size_t idx) noexcept {
  spdlog::debug("worker {} started", idx);

  try {
    for (;;) {
      if (cancel_.cancelled()) break;

      auto next = tasks_.pop();
      if (!next) break;
      const TaskId n = *next;

      // A failure may have landed while this worker was parked on the queue.
      if (cancel_.cancelled()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("worker {} dropping {} after cancellation", idx, task_label(n));
        break;
      }

      ExecResult r = execute_(n);
      const bool ok = r.success;

      Outcome o;
      o.task = n;
      o.success = ok;
      if (!ok) o.diagnostic = tail_bytes(r.diagnostic, kDiagnosticTailBytes);

      // Cancel before publishing so the collector never sees a failure ahead of the stop.
      if (!ok) {
        if (cancel_.request_cancel()) spdlog::debug("worker {} cancelling run after {} failed", idx, task_label(n));
        tasks_.close();
      }

      // `results` is unbounded and stays open while this worker is live.
      (void)results_.push(std::move(o));
    }
  } catch (const std::exception& e) {
    spdlog::error("worker {} fatal error: {}", idx, e.what());
    cancel_.request_cancel();
    tasks_.close();
  }

  worker_exit_(idx);
}

} // namespace seqbuild::core
