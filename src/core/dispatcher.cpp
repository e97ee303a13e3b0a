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

#include "core/dispatcher.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace seqbuild::core {

Dispatcher::Dispatcher(DispatchCfg cfg, Executor& exec, RunHooks hooks)
    : cfg_(cfg), exec_(exec), hooks_(std::move(hooks)), tasks_(task_queue_capacity(cfg.concurrency)) {}

Dispatcher::~Dispatcher() { shutdown_(); }

void Dispatcher::request_stop() noexcept {
  if (cancel_.request_cancel()) spdlog::debug("dispatcher: stop requested");
  tasks_.close();
}

void Dispatcher::shutdown_() noexcept {
  request_stop();

  if (pool_ && pool_->live() > 0) spdlog::debug("dispatcher: waiting for {} worker(s) to finish", pool_->live());

  source_.reset();
  pool_.reset();
}

Result<RunReport> Dispatcher::run() {
  if (ran_.exchange(true)) return Result<RunReport>::Fail("dispatcher: run() may only be called once");

  if (!cfg_.range.valid())
    return Result<RunReport>::Failf("invalid task range: start={} end={}", cfg_.range.start, cfg_.range.end);
  if (cfg_.concurrency == 0) return Result<RunReport>::Fail("concurrency must be at least 1");

  const std::size_t total = cfg_.range.total();

  ProgressReporter progress(total, hooks_.on_progress);
  ResultCollector collector(total, results_, progress, hooks_.on_failure);

  try {
    pool_ = std::make_unique<WorkerPool>(cfg_.concurrency, exec_, tasks_, results_, cancel_);
    source_ = std::make_unique<TaskSource>(cfg_.range, tasks_, cancel_);
  } catch (const std::exception& e) {
    shutdown_();
    return Result<RunReport>::Failf("failed to start run: {}", e.what());
  }

  collector.collect();

  RunReport rep;
  rep.range = cfg_.range;
  rep.total = total;
  rep.state = collector.state();
  rep.state.cancelled = rep.state.cancelled || cancel_.cancelled();
  rep.dropped = pool_->dropped();
  rep.elapsed = ProgressReporter::Clock::now() - progress.started();
  return Result<RunReport>::Ok(std::move(rep));
}

} // namespace seqbuild::core
