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

#include "core/str.hpp"
#include "core/task.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

using namespace seqbuild::core;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool cond) {
  if (cond) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check_str(const char* label, const std::string& got, const char* expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s: expected '%s', got '%s'\n", label, expected, got.c_str());
    ++g_fail;
  }
}

// ----- parse_bool -----

static void test_parse_bool() {
  check("bool.1", parse_bool("1") == true);
  check("bool.true", parse_bool("true") == true);
  check("bool.TRUE", parse_bool("TRUE") == true);
  check("bool.Yes", parse_bool("Yes") == true);
  check("bool.0", parse_bool("0") == false);
  check("bool.false", parse_bool("False") == false);
  check("bool.no", parse_bool("no") == false);
  check("bool.empty", !parse_bool("").has_value());
  check("bool.maybe", !parse_bool("maybe").has_value());
  check("bool.2", !parse_bool("2").has_value());
}

// ----- parse_u64 -----

static void test_parse_u64() {
  check("u64.zero", parse_u64("0") == 0u);
  check("u64.plain", parse_u64("6572") == 6572u);
  check("u64.max", parse_u64("18446744073709551615") == UINT64_MAX);
  check("u64.overflow", !parse_u64("18446744073709551616").has_value());
  check("u64.empty", !parse_u64("").has_value());
  check("u64.negative", !parse_u64("-1").has_value());
  check("u64.plus", !parse_u64("+1").has_value());
  check("u64.trailing", !parse_u64("12abc").has_value());
  check("u64.space", !parse_u64(" 12").has_value());
}

// ----- tail_bytes -----

static void test_tail_bytes() {
  check_str("tail.short", tail_bytes("abc", 10), "abc");
  check_str("tail.exact", tail_bytes("abcdef", 6), "abcdef");
  check_str("tail.cut", tail_bytes("abcdef", 2), "ef");
  check_str("tail.zero", tail_bytes("abcdef", 0), "");
  check_str("tail.empty", tail_bytes("", 3000), "");

  std::string big(4000, 'x');
  big.replace(1000, 1, "!");
  const auto t = tail_bytes(big, 3000);
  check("tail.big_size", t.size() == 3000);
  check("tail.big_front", t.front() == '!');
}

// ----- format_duration -----

static void test_format_duration() {
  using namespace std::chrono_literals;
  check_str("dur.zero", format_duration(0s), "0s");
  check_str("dur.secs", format_duration(42s), "42s");
  check_str("dur.minute", format_duration(60s), "1m00s");
  check_str("dur.mixed", format_duration(125s), "2m05s");
  check_str("dur.long", format_duration(3725s), "62m05s");
  check_str("dur.ms_truncates", format_duration(1999ms), "1s");
  check_str("dur.negative", format_duration(std::chrono::seconds(-5)), "0s");
}

// ----- task naming -----

static void test_task_names() {
  check_str("label.pad", task_label(7), "frame-0007");
  check_str("label.four", task_label(1234), "frame-1234");
  check_str("label.wide", task_label(12345), "frame-12345");
  check_str("pkg.default", task_package("@bad-apple", 7), "@bad-apple/frame-0007");
  check_str("pkg.custom", task_package("@demo", 42), "@demo/frame-0042");
}

static void test_task_range() {
  check("range.default_invalid", !TaskRange{}.valid());
  check("range.zero_start", !TaskRange{0, 5}.valid());
  check("range.inverted", !(TaskRange{5, 3}.valid()));
  check("range.inverted_total", TaskRange{5, 3}.total() == 0);
  check("range.single", TaskRange{4, 4}.total() == 1);
  check("range.total", TaskRange{3, 17}.total() == 15);
  check("range.contains", TaskRange{3, 17}.contains(3) && TaskRange{3, 17}.contains(17));
  check("range.excludes", !TaskRange{3, 17}.contains(2) && !TaskRange{3, 17}.contains(18));
}

int main() {
  test_parse_bool();
  test_parse_u64();
  test_tail_bytes();
  test_format_duration();
  test_task_names();
  test_task_range();

  std::fprintf(stdout, "str: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
