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

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using seqbuild::core::ProgressReporter;
using seqbuild::core::ProgressSnapshot;
using namespace std::chrono_literals;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool cond) {
  if (cond) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static bool near(double a, double b) { return a - b < 1e-6 && b - a < 1e-6; }

static void test_throttled() {
  std::vector<ProgressSnapshot> seen;
  const auto t0 = ProgressReporter::Clock::time_point{};
  ProgressReporter p(10, [&](const ProgressSnapshot& s) { seen.push_back(s); }, t0, 1000ms);

  check("throttle.early_skipped", !p.update(1, 1, t0 + 100ms));
  check("throttle.still_skipped", !p.update(2, 2, t0 + 999ms));
  check("throttle.emits_at_interval", p.update(3, 3, t0 + 1000ms));
  check("throttle.reset", !p.update(4, 4, t0 + 1500ms));
  check("throttle.next", p.update(5, 5, t0 + 2000ms));
  check("throttle.count", seen.size() == 2 && p.emissions() == 2);
}

static void test_final_always_emitted() {
  std::vector<ProgressSnapshot> seen;
  const auto t0 = ProgressReporter::Clock::time_point{};
  ProgressReporter p(3, [&](const ProgressSnapshot& s) { seen.push_back(s); }, t0, 1000ms);

  p.update(1, 1, t0 + 1ms);
  p.update(2, 2, t0 + 2ms);
  check("final.emitted", p.update(3, 3, t0 + 3ms));
  check("final.once", seen.size() == 1);
  check("final.done", !seen.empty() && seen.back().done == 3 && seen.back().total == 3);
  check("final.eta_zero", !seen.empty() && seen.back().eta.count() == 0);
}

static void test_rate_and_eta() {
  const auto s = ProgressReporter::snapshot(100, 20, 18, 10s);
  check("rate.done", s.done == 20);
  check("rate.ok", s.ok == 18);
  check("rate.failed", s.failed == 2);
  check("rate.value", near(s.rate, 2.0));
  check("rate.eta", s.eta == 40s);
}

static void test_snapshot_clamps() {
  const auto s = ProgressReporter::snapshot(5, 9, 12, 1s);
  check("clamp.done", s.done == 5);
  check("clamp.ok", s.ok == 5);
  check("clamp.failed", s.failed == 0);
  check("clamp.eta", s.eta.count() == 0);
}

static void test_zero_elapsed() {
  const auto s = ProgressReporter::snapshot(10, 0, 0, ProgressReporter::Clock::duration::zero());
  check("zero.rate", s.rate == 0.0);
  check("zero.eta", s.eta.count() == 0);

  const auto t = ProgressReporter::snapshot(10, 1, 1, ProgressReporter::Clock::duration::zero());
  check("zero.rate_finite", t.rate > 0.0);
}

static void test_format() {
  ProgressSnapshot s;
  s.done = 3;
  s.total = 10;
  s.ok = 2;
  s.failed = 1;
  s.rate = 1.5;
  s.eta = 125s;
  check("format.line",
        seqbuild::core::format_progress(s) == "progress: done=3/10 ok=2 failed=1 rate=1.5/s eta=2m05s");
}

int main() {
  test_throttled();
  test_final_always_emitted();
  test_rate_and_eta();
  test_snapshot_clamps();
  test_zero_elapsed();
  test_format();

  std::fprintf(stdout, "progress: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
