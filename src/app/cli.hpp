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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace seqbuild::app {

struct Options {
  bool help = false;
  bool version = false;
  bool verbose = false;

  std::optional<std::string> command; // only "build" is accepted

  std::optional<std::uint64_t> start;
  std::optional<std::uint64_t> end;         // inferred from frames_dir when absent
  std::optional<std::uint64_t> concurrency; // defaults to the hardware estimate, capped

  bool silent = true;
  bool dry_run = false;

  std::filesystem::path frames_dir = "apps/frames";
  std::string scope = "@bad-apple";
  std::string runner = "pnpm";
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace seqbuild::app
