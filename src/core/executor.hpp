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

#include "core/task.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace seqbuild::core {

// Upper bound on the diagnostic text kept per failed task.
inline constexpr std::size_t kDiagnosticTailBytes = 3000;

struct ExecResult {
  bool success = false;
  std::string diagnostic;

  static ExecResult Ok() { return {true, {}}; }
  static ExecResult Fail(std::string diag) { return {false, std::move(diag)}; }
};

// Runs one task. Called concurrently from every worker thread, so implementations must be
// thread safe. Failing to even start the task is reported as a failed ExecResult.
class Executor {
public:
  virtual ~Executor() = default;

  virtual ExecResult run(TaskId n) = 0;
};

} // namespace seqbuild::core
