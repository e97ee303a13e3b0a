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

#include "core/collector.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace seqbuild::core {

ResultCollector::ResultCollector(std::size_t total, OutcomeQueue& results, ProgressReporter& progress,
                                 FailureHook on_failure)
    : total_(total), results_(results), progress_(progress), on_failure_(std::move(on_failure)) {}

bool ResultCollector::accept(Outcome o) {
  if (st_.done < total_) ++st_.done;
  if (o.success && st_.succeeded < st_.done) ++st_.succeeded;

  const bool failed = !o.success;
  const bool first = failed && !st_.first_failure;
  if (first) st_.first_failure = std::move(o);
  if (failed) st_.cancelled = true;

  progress_.update(st_.done, st_.succeeded);

  // Later failures are counted but never surfaced.
  if (first && on_failure_) on_failure_(*st_.first_failure);
  return !failed;
}

void ResultCollector::collect() {
  while (auto o = results_.pop()) {
    if (!accept(std::move(*o))) {
      spdlog::debug("collector: stopping at first failure, {} queued outcome(s) left unread", results_.size());
      return;
    }
  }
}

} // namespace seqbuild::core
