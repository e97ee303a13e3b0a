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

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace seqbuild::core {

// Multi-producer / multi-consumer FIFO. Every pushed item is popped by exactly one consumer.
// close() rejects further pushes and wakes everyone; pop() keeps draining what is left and
// returns nullopt only once the queue is both closed and empty.
template <class T> class BoundedQueue {
public:
  static constexpr std::size_t kUnbounded = 0;

  explicit BoundedQueue(std::size_t capacity) : cap_(capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks while full. Returns false (and drops v) if the queue is or becomes closed.
  bool push(T v) {
    {
      std::unique_lock lk(m_);
      cv_can_push_.wait(lk, [&] { return closed_ || cap_ == kUnbounded || q_.size() < cap_; });
      if (closed_) return false;
      q_.push_back(std::move(v));
    }
    cv_can_pop_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::optional<T> out;
    {
      std::unique_lock lk(m_);
      cv_can_pop_.wait(lk, [&] { return closed_ || !q_.empty(); });
      if (q_.empty()) return std::nullopt;
      out.emplace(std::move(q_.front()));
      q_.pop_front();
    }
    cv_can_push_.notify_one();
    return out;
  }

  void close() noexcept {
    {
      std::lock_guard lk(m_);
      closed_ = true;
    }
    cv_can_push_.notify_all();
    cv_can_pop_.notify_all();
  }

  bool closed() const {
    std::lock_guard lk(m_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lk(m_);
    return q_.size();
  }

  std::size_t capacity() const noexcept { return cap_; }

private:
  const std::size_t cap_;

  mutable std::mutex m_;
  std::condition_variable cv_can_push_;
  std::condition_variable cv_can_pop_;

  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace seqbuild::core
