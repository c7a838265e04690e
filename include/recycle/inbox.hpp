/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file inbox.hpp
 * @brief Bounded multi-producer single-consumer inbox for service actors.
 *
 * Producers (callers) block in Put() while the inbox is full, up to a
 * timeout. The single consumer (the actor thread) blocks in Take() until a
 * message arrives or the inbox is closed. Items leave in FIFO order.
 *
 * Close() is one-way: further Put() calls fail with kClosed, Take() returns
 * false, and whatever is still queued can be collected with TryTake() so
 * every message gets answered.
 */

#ifndef RECYCLE_INBOX_HPP_
#define RECYCLE_INBOX_HPP_

#include "recycle/platform.hpp"
#include "recycle/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace recycle {

enum class InboxError : uint8_t { kTimeout, kClosed };

template <typename T>
class BoundedInbox final {
 public:
  explicit BoundedInbox(uint32_t capacity) noexcept
      : capacity_(capacity > 0U ? capacity : 1U) {}

  BoundedInbox(const BoundedInbox&) = delete;
  BoundedInbox& operator=(const BoundedInbox&) = delete;
  BoundedInbox(BoundedInbox&&) = delete;
  BoundedInbox& operator=(BoundedInbox&&) = delete;

  /**
   * @brief Enqueue an item, waiting up to @p timeout for free space.
   *
   * On failure the item is not enqueued and is left untouched in the
   * caller's hands.
   */
  expected<void, InboxError> Put(T& item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    const bool ready = not_full_.wait_for(lock, timeout, [this]() {
      return closed_ || items_.size() < capacity_;
    });
    if (closed_) {
      return expected<void, InboxError>::error(InboxError::kClosed);
    }
    if (!ready) {
      return expected<void, InboxError>::error(InboxError::kTimeout);
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return expected<void, InboxError>::success();
  }

  /**
   * @brief Dequeue the oldest item, blocking while the inbox is empty.
   * @return false once the inbox is closed.
   */
  bool Take(T& out) {
    std::unique_lock<std::mutex> lock(mtx_);
    not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (closed_) {
      return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  /** @brief Non-blocking dequeue; works after Close() to drain leftovers. */
  bool TryTake(T& out) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (items_.empty()) {
      return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  uint32_t Size() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(items_.size());
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  const uint32_t capacity_;
  bool closed_ = false;
};

}  // namespace recycle

#endif  // RECYCLE_INBOX_HPP_
