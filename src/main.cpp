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
#include "app/run.hpp"
#include "app/version.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  // stdout stays free for build output; everything we say goes to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("seqbuild"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try {
    auto opt = seqbuild::app::parse_cli(argc, argv);
    if (!opt) {
      spdlog::error("{}", opt.st.msg);
      std::cerr << seqbuild::app::usage_text();
      return static_cast<int>(seqbuild::app::RunResult::kConfigError);
    }

    if (opt.value.help) {
      std::cout << seqbuild::app::usage_text();
      return EXIT_SUCCESS;
    }
    if (opt.value.version) {
      spdlog::info("seqbuild v{}", seqbuild::app::version_string());
      return EXIT_SUCCESS;
    }

    return static_cast<int>(seqbuild::app::run_build(opt.value));
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
}
