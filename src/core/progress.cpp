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

#include "core/progress.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace seqbuild::core {

namespace {

constexpr double kMinElapsedSec = 0.0001;

} // namespace

std::string format_progress(const ProgressSnapshot& s) {
  return fmt::format("progress: done={}/{} ok={} failed={} rate={:.1f}/s eta={}",
                     s.done, s.total, s.ok, s.failed, s.rate, format_duration(s.eta));
}

ProgressReporter::ProgressReporter(std::size_t total, Sink sink, Clock::time_point start, Clock::duration interval)
    : total_(total), sink_(std::move(sink)), start_(start), last_emit_(start), interval_(interval) {}

ProgressSnapshot ProgressReporter::snapshot(std::size_t total, std::size_t done, std::size_t ok,
                                            Clock::duration elapsed) {
  ProgressSnapshot s;
  s.total = total;
  s.done = std::min(done, total);
  s.ok = std::min(ok, s.done);
  s.failed = s.done - s.ok;
  s.elapsed = elapsed;

  const double secs = std::max(std::chrono::duration<double>(elapsed).count(), kMinElapsedSec);
  s.rate = static_cast<double>(s.done) / secs;

  const std::size_t left = total - s.done;
  if (s.rate > 0.0)
    s.eta = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(static_cast<double>(left) / s.rate));
  return s;
}

bool ProgressReporter::update(std::size_t done, std::size_t ok, Clock::time_point now) {
  if (now - last_emit_ < interval_ && done != total_) return false;

  const auto s = snapshot(total_, done, ok, now - start_);
  if (sink_) sink_(s);
  else spdlog::info("{}", format_progress(s));

  last_emit_ = now;
  ++emissions_;
  return true;
}

} // namespace seqbuild::core
