/**
 * @file shared_cursor.hpp
 * @brief SharedCursor - serialized advancement of one item sequence.
 *
 * Wraps a pull function behind a mutex so that any number of workers can
 * call TryAdvance() and each produced item is handed to exactly one of
 * them. The lock covers only the pull step; the item belongs to the caller
 * once TryAdvance() returns.
 *
 * After the sequence reports exhaustion the pull function is never invoked
 * again and every later TryAdvance() returns false.
 */

#ifndef QPIPE_SHARED_CURSOR_HPP_
#define QPIPE_SHARED_CURSOR_HPP_

#include "qpipe/platform.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>

namespace qpipe {

/**
 * @brief Pull function for a sequence of Item.
 *
 * Writes the next item to *out and returns true, or returns false when the
 * sequence is exhausted. May throw; the exception reaches the caller of
 * SharedCursor::TryAdvance() with the lock released.
 */
template <typename Item>
using PullFn = std::function<bool(Item* out)>;

template <typename Item>
class SharedCursor final {
 public:
  explicit SharedCursor(PullFn<Item> pull) : pull_(std::move(pull)) {
    QPIPE_ASSERT(static_cast<bool>(pull_));
  }

  SharedCursor(const SharedCursor&) = delete;
  SharedCursor& operator=(const SharedCursor&) = delete;
  SharedCursor(SharedCursor&&) = delete;
  SharedCursor& operator=(SharedCursor&&) = delete;

  /**
   * @brief Advance the sequence by one item.
   * @return true and the item in *out, or false once exhausted.
   */
  bool TryAdvance(Item* out) {
    QPIPE_ASSERT(out != nullptr);
    if (exhausted_.load(std::memory_order_acquire)) {
      return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (exhausted_.load(std::memory_order_relaxed)) {
      return false;
    }
    if (pull_(out)) {
      ++yielded_;
      return true;
    }
    exhausted_.store(true, std::memory_order_release);
    return false;
  }

  bool IsExhausted() const noexcept {
    return exhausted_.load(std::memory_order_acquire);
  }

  /// @brief Items handed out so far.
  uint64_t Yielded() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return yielded_;
  }

 private:
  mutable std::mutex mtx_;
  PullFn<Item> pull_;
  std::atomic<bool> exhausted_{false};
  uint64_t yielded_{0U};
};

}  // namespace qpipe

#endif  // QPIPE_SHARED_CURSOR_HPP_
