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

#include <atomic>

namespace seqbuild::core {

// Set-once stop flag shared by the producer and the workers of one run.
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Returns true only for the call that flipped the flag.
  bool request_cancel() noexcept { return !cancel_.exchange(true, std::memory_order_relaxed); }
  bool cancelled() const noexcept { return cancel_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool cancel_{false};
};

} // namespace seqbuild::core
