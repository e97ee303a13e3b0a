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

#include "app/cli.hpp"
#include "app/version.hpp"

#include "core/str.hpp"

#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace seqbuild::app {

using core::Result;

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                  std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return Result<std::string_view>::Fail(std::string(opt) + " requires value");
  return Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static Result<std::uint64_t> read_count_value(int& i, int argc, char** argv,
                                              std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return Result<std::uint64_t>::Fail(std::move(vr.st));
  auto n = core::parse_u64(vr.value);
  if (!n) return Result<std::uint64_t>::Failf("{} expects a non-negative integer, got '{}'", opt, vr.value);
  return Result<std::uint64_t>::Ok(*n);
}

// `--flag=V`, `--flag V`, or a bare `--flag` (true) when no value follows.
static Result<bool> read_bool_value(int& i, int argc, char** argv,
                                    std::string_view a, std::string_view opt) noexcept
{
  std::string_view raw;
  if (auto ov = opt_value(a, opt)) {
    raw = *ov;
  } else {
    if (i + 1 >= argc) return Result<bool>::Ok(true);
    std::string_view nxt = argv[i + 1];
    if (nxt.starts_with("-") || nxt == "build") return Result<bool>::Ok(true);
    raw = nxt;
    ++i;
  }

  auto b = core::parse_bool(raw);
  if (!b) return Result<bool>::Failf("{} expects 0|1|true|false|yes|no, got '{}'", opt, raw);
  return Result<bool>::Ok(*b);
}

std::string usage_text() {
  std::string out;
  out.reserve(1536);

  out += "seqbuild v";
  out += version_string();
  out += "\n\n";

  out += R"(Usage:
  seqbuild build [--start=N] [--end=N] [--concurrency=N] [--silent=0|1] [--dry-run=0|1]
                 [--frames-dir=PATH] [--scope=NAME] [--runner=PROG] [-v]

Builds the workspace packages <scope>/frame-NNNN (4 digits) for N in [start, end],
running `<runner> --filter <package> build` for each, at most `concurrency` at a time.
The first failure (or an interrupt) stops the run: no further build starts, and
builds already running are allowed to finish before seqbuild exits.

Options:
  --start=N                    first frame (default 1)
  --end=N                      last frame (default: highest frame-NNNN entry in --frames-dir)
  --concurrency=N              parallel builds (default: CPU count, at most 8)
  --silent=0|1                 discard build stdout (default 1)
  --dry-run=0|1                report every frame as built without running anything (default 0)
  --frames-dir=PATH            directory scanned to infer --end (default apps/frames)
  --scope=NAME                 package scope (default @bad-apple)
  --runner=PROG                build program (default pnpm)
  --verbose, -v                enable verbose logging
  --help, -h
  --version

Exit status:
  0  every frame built
  1  a build failed or the run was stopped
  2  usage or configuration error
)";
  return out;
}

Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }

    if (a == "--verbose" || a == "-v") {
      o.verbose = true;
      spdlog::set_level(spdlog::level::debug);
      continue;
    }

    if (is_opt(a, "--start")) {
      auto r = read_count_value(i, argc, argv, a, "--start");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.start = r.value;
      continue;
    }
    if (is_opt(a, "--end")) {
      auto r = read_count_value(i, argc, argv, a, "--end");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.end = r.value;
      continue;
    }
    if (is_opt(a, "--concurrency")) {
      auto r = read_count_value(i, argc, argv, a, "--concurrency");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.concurrency = r.value;
      continue;
    }

    if (is_opt(a, "--silent")) {
      auto r = read_bool_value(i, argc, argv, a, "--silent");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.silent = r.value;
      continue;
    }
    if (is_opt(a, "--dry-run")) {
      auto r = read_bool_value(i, argc, argv, a, "--dry-run");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.dry_run = r.value;
      continue;
    }

    if (is_opt(a, "--frames-dir")) {
      auto r = read_string_value(i, argc, argv, a, "--frames-dir");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      o.frames_dir = std::filesystem::path(std::string(r.value));
      continue;
    }
    if (is_opt(a, "--scope")) {
      auto r = read_string_value(i, argc, argv, a, "--scope");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      if (r.value.empty()) return Result<Options>::Fail("--scope cannot be empty");
      o.scope = std::string(r.value);
      continue;
    }
    if (is_opt(a, "--runner")) {
      auto r = read_string_value(i, argc, argv, a, "--runner");
      if (!r) return Result<Options>::Fail(std::move(r.st));
      if (r.value.empty()) return Result<Options>::Fail("--runner cannot be empty");
      o.runner = std::string(r.value);
      continue;
    }

    if (a.starts_with("-")) return Result<Options>::Fail("Unknown option: " + std::string(a));

    if (o.command) return Result<Options>::Fail("Unexpected argument: " + std::string(a));
    if (a != "build") return Result<Options>::Fail("Unknown command: " + std::string(a));
    o.command = std::string(a);
  }

  if (!o.help && !o.version && !o.command) return Result<Options>::Fail("No command given");

  return Result<Options>::Ok(std::move(o));
}

} // namespace seqbuild::app
