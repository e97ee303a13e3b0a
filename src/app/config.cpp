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

#include "app/config.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace seqbuild::app {

static constexpr std::string_view kFramePrefix = "frame-";
static constexpr std::size_t kFrameDigits = 4;

static std::optional<core::TaskId> frame_number(std::string_view name) {
  if (!name.starts_with(kFramePrefix)) return std::nullopt;
  const auto digits = name.substr(kFramePrefix.size());
  if (digits.size() != kFrameDigits) return std::nullopt;
  return core::parse_u64(digits);
}

std::optional<core::TaskId> infer_end(const std::filesystem::path& frames_dir) noexcept {
  try {
    std::error_code ec;
    std::filesystem::directory_iterator it(frames_dir, ec);
    if (ec) {
      spdlog::debug("cannot list {}: {}", frames_dir.string(), ec.message());
      return std::nullopt;
    }

    std::optional<core::TaskId> max_n;
    for (const auto& e : it) {
      const auto n = frame_number(e.path().filename().string());
      if (n) max_n = max_n ? std::max(*max_n, *n) : *n;
    }
    return max_n;
  } catch (const std::exception& e) {
    spdlog::debug("cannot list {}: {}", frames_dir.string(), e.what());
    return std::nullopt;
  }
}

std::size_t default_concurrency() noexcept {
  const unsigned hw = std::thread::hardware_concurrency();
  const std::size_t n = hw ? hw : kMaxDefaultConcurrency;
  return std::clamp<std::size_t>(n, 1, kMaxDefaultConcurrency);
}

static core::Status check_range(const core::TaskRange& r) {
  if (r.end == 0 || r.end < r.start) return core::Status::Failf("invalid frame range: start={} end={}", r.start, r.end);
  if (r.start == 0) return core::Status::Fail("--start must be at least 1");
  return core::Status::Ok();
}

static core::Status validate(const RunConfig& cfg) {
  SEQBUILD_TRY(check_range(cfg.range));
  if (cfg.concurrency == 0) return core::Status::Fail("--concurrency must be at least 1");
  return core::Status::Ok();
}

static void fill(RunConfig& cfg, const Options& opt) {
  cfg.range.start = opt.start.value_or(1);

  if (opt.end) {
    cfg.range.end = *opt.end;
  } else {
    const auto inferred = infer_end(opt.frames_dir);
    cfg.range.end = inferred.value_or(0);
    if (inferred) spdlog::debug("inferred end={} from {}", *inferred, opt.frames_dir.string());
    else spdlog::debug("no frame-NNNN entries under {}", opt.frames_dir.string());
  }

  cfg.concurrency = opt.concurrency ? static_cast<std::size_t>(*opt.concurrency) : default_concurrency();
  cfg.silent = opt.silent;
  cfg.dry_run = opt.dry_run;
  cfg.scope = opt.scope;
  cfg.runner = opt.runner;
}

core::Result<RunConfig> resolve_config(const Options& opt) {
  RunConfig cfg;
  fill(cfg, opt);

  auto st = validate(cfg);
  if (!st.ok) return core::Result<RunConfig>::Fail(std::move(st));
  return core::Result<RunConfig>::Ok(std::move(cfg));
}

} // namespace seqbuild::app
