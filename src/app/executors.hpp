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

#include "core/executor.hpp"
#include "core/task.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace seqbuild::app {

class DryRunExecutor final : public core::Executor {
public:
  core::ExecResult run(core::TaskId n) override;

  std::size_t calls() const noexcept { return calls_.load(std::memory_order_relaxed); }

private:
  std::atomic<std::size_t> calls_{0};
};

// Runs `<runner> --filter <scope>/frame-NNNN build` per task.
class BuildCommandExecutor final : public core::Executor {
public:
  struct Cfg {
    std::string runner = "pnpm";
    std::string scope = "@bad-apple";
    bool silent = true;
  };

  explicit BuildCommandExecutor(Cfg cfg);

  core::ExecResult run(core::TaskId n) override;

  std::vector<std::string> command_for(core::TaskId n) const;

private:
  Cfg cfg_;
};

} // namespace seqbuild::app
