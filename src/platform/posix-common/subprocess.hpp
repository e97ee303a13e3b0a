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

#include "core/status.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace seqbuild::posix_common {

struct SpawnSpec {
  std::vector<std::string> argv; // argv[0] is looked up in PATH
  bool silence_stdout = true;
  std::size_t stderr_tail_bytes = 3000;
};

struct ProcessExit {
  int exit_code = -1;   // valid when term_signal == 0
  int term_signal = 0;
  std::string stderr_tail;

  bool ok() const noexcept { return term_signal == 0 && exit_code == 0; }
};

// Runs argv to completion with stdin on /dev/null and stderr captured (only the tail is kept).
// Fails only when the process could not be started; a non-zero exit is a successful Result.
core::Result<ProcessExit> run_process(const SpawnSpec& spec) noexcept;

} // namespace seqbuild::posix_common
