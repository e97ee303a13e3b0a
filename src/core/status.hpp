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

#include <string>
#include <utility>

namespace seqbuild::core {

struct Status {
  bool ok = true;
  std::string msg;

  Status() = default;
  Status(bool ok_, std::string msg_) : ok(ok_), msg(std::move(msg_)) {}

  static Status Ok() { return {}; }
  static Status Fail(std::string msg) { return Status(false, std::move(msg)); }

  template <class... Args>
  static Status Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return ok; }
};

// Value-or-status. T must be default constructible; `value` is only meaningful when ok.
template <class T>
struct Result {
  Status st{false, {}};
  T value{};

  static Result Ok(T v) {
    Result r;
    r.st = Status::Ok();
    r.value = std::move(v);
    return r;
  }

  static Result Fail(std::string msg) {
    Result r;
    r.st = Status::Fail(std::move(msg));
    return r;
  }

  static Result Fail(Status st) {
    Result r;
    r.st = std::move(st);
    r.st.ok = false;
    return r;
  }

  template <class... Args>
  static Result Failf(fmt::format_string<Args...> f, Args&&... args) {
    return Fail(fmt::format(f, std::forward<Args>(args)...));
  }

  explicit operator bool() const noexcept { return st.ok; }
};

} // namespace seqbuild::core

#define SEQBUILD_TRY(expr) do { auto _st = (expr); if (!_st.ok) return _st; } while (0)
