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

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace seqbuild::core {

constexpr unsigned char ascii_lower(unsigned char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a') : c;
}

constexpr bool equals_ci(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}

constexpr std::optional<bool> parse_bool(std::string_view s) noexcept {
  if (s == "1" || equals_ci(s, "true") || equals_ci(s, "yes")) return true;
  if (s == "0" || equals_ci(s, "false") || equals_ci(s, "no")) return false;
  return std::nullopt;
}

// Whole-string unsigned decimal; no sign, no whitespace.
inline std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
  if (s.empty()) return std::nullopt;
  std::uint64_t v = 0;
  const auto* end = s.data() + s.size();
  const auto [p, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc{} || p != end) return std::nullopt;
  return v;
}

// Last `max_bytes` bytes of `s`. Byte-wise: a multi-byte sequence may be cut at the front.
inline std::string tail_bytes(std::string_view s, std::size_t max_bytes) {
  if (s.size() <= max_bytes) return std::string(s);
  return std::string(s.substr(s.size() - max_bytes));
}

inline std::string format_duration(std::chrono::seconds d) {
  const auto secs = d.count() < 0 ? 0 : d.count();
  const auto m = secs / 60;
  const auto s = secs % 60;
  if (m > 0) return fmt::format("{}m{:02}s", m, s);
  return fmt::format("{}s", s);
}

template <class Rep, class Period>
inline std::string format_duration(std::chrono::duration<Rep, Period> d) {
  return format_duration(std::chrono::duration_cast<std::chrono::seconds>(d));
}

} // namespace seqbuild::core
