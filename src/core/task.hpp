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

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace seqbuild::core {

using TaskId = std::uint64_t;

// Inclusive range [start, end].
struct TaskRange {
  TaskId start = 1;
  TaskId end = 0;

  constexpr bool valid() const noexcept { return start >= 1 && end >= start; }
  constexpr std::size_t total() const noexcept { return valid() ? static_cast<std::size_t>(end - start + 1) : 0; }
  constexpr bool contains(TaskId n) const noexcept { return n >= start && n <= end; }
};

struct Outcome {
  TaskId task = 0;
  bool success = false;
  std::string diagnostic;
};

inline std::string task_label(TaskId n) { return fmt::format("frame-{:04}", n); }

inline std::string task_package(std::string_view scope, TaskId n) {
  return fmt::format("{}/{}", scope, task_label(n));
}

} // namespace seqbuild::core
