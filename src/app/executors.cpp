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

#include "app/executors.hpp"

#include "platform/platform_all.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace seqbuild::app {

core::ExecResult DryRunExecutor::run(core::TaskId) {
  calls_.fetch_add(1, std::memory_order_relaxed);
  return core::ExecResult::Ok();
}

BuildCommandExecutor::BuildCommandExecutor(Cfg cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> BuildCommandExecutor::command_for(core::TaskId n) const {
  return {cfg_.runner, "--filter", core::task_package(cfg_.scope, n), "build"};
}

core::ExecResult BuildCommandExecutor::run(core::TaskId n) {
  platform::SpawnSpec spec;
  spec.argv = command_for(n);
  spec.silence_stdout = cfg_.silent;
  spec.stderr_tail_bytes = core::kDiagnosticTailBytes;

  auto r = platform::run_process(spec);
  if (!r) return core::ExecResult::Fail(std::move(r.st.msg));

  const auto& px = r.value;
  if (px.ok()) return core::ExecResult::Ok();

  spdlog::debug("{}: exit_code={} signal={}", core::task_label(n), px.exit_code, px.term_signal);

  if (!px.stderr_tail.empty()) return core::ExecResult::Fail(px.stderr_tail);
  if (px.term_signal) return core::ExecResult::Fail(fmt::format("terminated by signal {}", px.term_signal));
  return core::ExecResult::Fail({});
}

} // namespace seqbuild::app
