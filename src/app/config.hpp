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

#include "app/cli.hpp"

#include "core/status.hpp"
#include "core/task.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace seqbuild::app {

inline constexpr std::size_t kMaxDefaultConcurrency = 8;

struct RunConfig {
  core::TaskRange range;
  std::size_t concurrency = 1;
  bool silent = true;
  bool dry_run = false;
  std::string scope = "@bad-apple";
  std::string runner = "pnpm";
};

// Highest N among entries named frame-NNNN (exactly four digits) in `frames_dir`.
std::optional<core::TaskId> infer_end(const std::filesystem::path& frames_dir) noexcept;

std::size_t default_concurrency() noexcept;

// Fills defaults and validates. Fails (nothing may run) on an empty or inverted range.
core::Result<RunConfig> resolve_config(const Options& opt);

} // namespace seqbuild::app
