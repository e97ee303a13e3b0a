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

#include "app/run.hpp"

#include "app/executors.hpp"

#include "core/dispatcher.hpp"
#include "core/str.hpp"
#include "platform/platform_all.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace seqbuild::app {

static bool has_text(std::string_view s) {
  return s.find_first_not_of(" \t\r\n") != std::string_view::npos;
}

static void report_failure(const RunConfig& cfg, const core::Outcome& o) {
  spdlog::error("failed: {} ({})", core::task_label(o.task), core::task_package(cfg.scope, o.task));
  if (has_text(o.diagnostic)) spdlog::error("stderr tail:\n{}", o.diagnostic);
}

static RunResult report_verdict(const core::RunReport& rep) {
  const auto& st = rep.state;
  const auto took = core::format_duration(rep.elapsed);

  if (rep.success()) {
    spdlog::info("success: built {} frames in {}", st.succeeded, took);
    return RunResult::Success;
  }

  if (st.first_failure) {
    spdlog::error("exit: build failed at {} after {}", core::task_label(st.first_failure->task), took);
  } else {
    spdlog::error("exit: build stopped (done={}/{} ok={}) after {}", st.done, rep.total, st.succeeded, took);
  }
  if (rep.dropped) spdlog::debug("{} dequeued task(s) were dropped after cancellation", rep.dropped);
  return RunResult::kBuildFailed;
}

RunResult run_build(const RunConfig& cfg, core::Executor& executor, bool handle_signals) {
  spdlog::info("build frames: start={} end={} total={} concurrency={} silent={} dry_run={}",
               cfg.range.start, cfg.range.end, cfg.range.total(), cfg.concurrency,
               cfg.silent ? 1 : 0, cfg.dry_run ? 1 : 0);

  core::RunHooks hooks;
  hooks.on_failure = [&cfg](const core::Outcome& o) { report_failure(cfg, o); };

  core::Dispatcher dispatcher({cfg.range, cfg.concurrency}, executor, std::move(hooks));

  // Declared after the dispatcher so the watcher thread is gone before the dispatcher is.
  std::optional<platform::SignalShield> shield;
  if (handle_signals) {
    shield = platform::SignalShield::enable([&dispatcher] { dispatcher.request_stop(); });
    if (!shield) spdlog::warn("Could not install signal handlers; interrupts will terminate immediately");
  }

  auto rr = dispatcher.run();
  if (!rr) {
    spdlog::error("{}", rr.st.msg);
    return RunResult::kBuildFailed;
  }

  return report_verdict(rr.value);
}

RunResult run_build(const Options& opt, core::Executor* executor) {
  auto cr = resolve_config(opt);
  if (!cr) {
    spdlog::error("{}", cr.st.msg);
    return RunResult::kConfigError;
  }
  const RunConfig& cfg = cr.value;

  if (executor) return run_build(cfg, *executor);

  if (cfg.dry_run) {
    DryRunExecutor dry;
    return run_build(cfg, dry);
  }

  BuildCommandExecutor real({cfg.runner, cfg.scope, cfg.silent});
  return run_build(cfg, real);
}

} // namespace seqbuild::app
