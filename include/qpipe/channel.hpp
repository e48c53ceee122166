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
 * @file channel.hpp
 * @brief Channel<T> - MPMC FIFO with optional capacity and one-way completion.
 *
 * Lifecycle:
 *   open --Complete(fault?)--> completed (no writes) --drained--> exhausted
 *
 * Writers:
 *   TryWrite()  never blocks; false when full or completed.
 *   Write()     blocks until room, completion or cancellation.
 * Readers:
 *   TryRead()   never blocks.
 *   Read()      blocks until an item, drained completion, or cancellation.
 *               Buffered items are always delivered before completion is
 *               reported.
 *
 * A drained channel reports ErrorCode::kChannelClosed when completed cleanly,
 * or the Fault passed to Complete() otherwise, so downstream readers observe
 * the same failure the producer saw.
 *
 * Thread-safe for any number of readers and writers (mutex + condvar).
 */

#ifndef QPIPE_CHANNEL_HPP_
#define QPIPE_CHANNEL_HPP_

#include "qpipe/cancel.hpp"
#include "qpipe/platform.hpp"
#include "qpipe/vocabulary.hpp"

#include <cstdint>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

// ============================================================================
// Compile-time configuration
// ============================================================================

/// @brief Default channel capacity (0 = unbounded).
#ifndef QPIPE_DEFAULT_CHANNEL_CAPACITY
#define QPIPE_DEFAULT_CHANNEL_CAPACITY 0U
#endif

namespace qpipe {

static constexpr uint32_t kUnboundedCapacity = 0U;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Channel configuration.
 *
 * single_reader is an optimization hint recorded for consumers; the channel
 * stays correct when it is violated.
 */
struct ChannelOptions {
  uint32_t capacity{QPIPE_DEFAULT_CHANNEL_CAPACITY};
  bool single_reader{false};
};

struct ChannelStats {
  uint64_t written;      ///< Items accepted (TryWrite + Write).
  uint64_t read;         ///< Items delivered to readers.
  uint64_t write_waits;  ///< Write() calls that had to block for room.
};

// ============================================================================
// Channel<T>
// ============================================================================

template <typename T>
class Channel final {
 public:
  explicit Channel(const ChannelOptions& options = ChannelOptions{})
      : capacity_(options.capacity), single_reader_(options.single_reader) {}

  ~Channel() = default;

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;

  /// @brief Convenience factory; channels are shared between stages.
  static std::shared_ptr<Channel> Create(uint32_t capacity = kUnboundedCapacity,
                                         bool single_reader = false) {
    ChannelOptions opts;
    opts.capacity = capacity;
    opts.single_reader = single_reader;
    return std::make_shared<Channel>(opts);
  }

  // ==========================================================================
  // Writer API
  // ==========================================================================

  /**
   * @brief Non-blocking write.
   * @return false if the channel is full or completed. The item is moved
   *         from only on success.
   */
  bool TryWrite(T&& item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (completed_ || IsFullLocked()) {
        return false;
      }
      items_.push_back(std::move(item));
      ++written_;
    }
    readable_cv_.notify_one();
    return true;
  }

  bool TryWrite(const T& item) {
    T copy(item);
    return TryWrite(std::move(copy));
  }

  /**
   * @brief Blocking write.
   *
   * Waits for room when bounded. Returns kChannelClosed if the channel is
   * (or becomes) completed, kCanceled if @p token fires before room frees.
   */
  expected<void, Fault> Write(T item, const CancelToken& token = CancelToken::None()) {
    if (token.IsCancelRequested()) {
      return expected<void, Fault>::error(Fault::Make(ErrorCode::kCanceled));
    }
    // Registration must outlive the lock (see CancelState::Unregister).
    CancelRegistration reg = token.Register([this] { WakeAll(); });
    {
      std::unique_lock<std::mutex> lk(mtx_);
      if (!completed_ && IsFullLocked()) {
        ++write_waits_;
        writable_cv_.wait(lk, [&] {
          return completed_ || !IsFullLocked() || token.IsCancelRequested();
        });
      }
      if (completed_) {
        return expected<void, Fault>::error(
            Fault::Make(ErrorCode::kChannelClosed, "write after completion"));
      }
      if (IsFullLocked()) {
        return expected<void, Fault>::error(Fault::Make(ErrorCode::kCanceled));
      }
      items_.push_back(std::move(item));
      ++written_;
    }
    readable_cv_.notify_one();
    return expected<void, Fault>::success();
  }

  /// @brief false once Complete() has been called.
  bool IsWritable() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !completed_;
  }

  /**
   * @brief Mark the channel complete without a fault. Idempotent.
   * @return true if this call completed the channel.
   */
  bool Complete() { return Complete(Fault{}); }

  /**
   * @brief Mark the channel complete, carrying @p fault (kNone = clean).
   * @return false (no-op) if the channel was already completed.
   */
  bool Complete(const Fault& fault) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (completed_) {
        return false;
      }
      completed_ = true;
      completion_ = fault;
    }
    readable_cv_.notify_all();
    writable_cv_.notify_all();
    drained_cv_.notify_all();
    return true;
  }

  // ==========================================================================
  // Reader API
  // ==========================================================================

  /// @brief Non-blocking read. @return false if nothing is buffered.
  bool TryRead(T* out) {
    QPIPE_ASSERT(out != nullptr);
    bool drained = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (items_.empty()) {
        return false;
      }
      *out = std::move(items_.front());
      items_.pop_front();
      ++read_;
      drained = completed_ && items_.empty();
    }
    writable_cv_.notify_one();
    if (drained) {
      drained_cv_.notify_all();
    }
    return true;
  }

  /**
   * @brief Blocking read.
   *
   * @return The next item; kChannelClosed (or the completion fault) once
   *         completed and drained; kCanceled if @p token fires first.
   */
  expected<T, Fault> Read(const CancelToken& token = CancelToken::None()) {
    if (token.IsCancelRequested()) {
      return expected<T, Fault>::error(Fault::Make(ErrorCode::kCanceled));
    }
    CancelRegistration reg = token.Register([this] { WakeAll(); });
    std::unique_lock<std::mutex> lk(mtx_);
    readable_cv_.wait(lk, [&] {
      return !items_.empty() || completed_ || token.IsCancelRequested();
    });
    if (!items_.empty()) {
      T item(std::move(items_.front()));
      items_.pop_front();
      ++read_;
      const bool drained = completed_ && items_.empty();
      lk.unlock();
      writable_cv_.notify_one();
      if (drained) {
        drained_cv_.notify_all();
      }
      return expected<T, Fault>::success(std::move(item));
    }
    if (completed_) {
      return expected<T, Fault>::error(CompletionFaultLocked());
    }
    return expected<T, Fault>::error(Fault::Make(ErrorCode::kCanceled));
  }

  /**
   * @brief Block until the channel is completed and drained.
   * @return success for a clean completion, the completion fault otherwise,
   *         or kCanceled if @p token fires first.
   */
  expected<void, Fault> WaitForCompletion(
      const CancelToken& token = CancelToken::None()) {
    CancelRegistration reg = token.Register([this] { WakeAll(); });
    std::unique_lock<std::mutex> lk(mtx_);
    drained_cv_.wait(lk, [&] {
      return (completed_ && items_.empty()) || token.IsCancelRequested();
    });
    if (completed_ && items_.empty()) {
      if (completion_.code == ErrorCode::kNone) {
        return expected<void, Fault>::success();
      }
      return expected<void, Fault>::error(completion_);
    }
    return expected<void, Fault>::error(Fault::Make(ErrorCode::kCanceled));
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  bool IsCompleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_;
  }

  /// @brief Completed and no buffered items remain.
  bool IsDrained() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_ && items_.empty();
  }

  /// @brief Fault passed to Complete(); code kNone while open or clean.
  Fault CompletionFault() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completion_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
  }

  uint32_t Capacity() const noexcept { return capacity_; }
  bool IsBounded() const noexcept { return capacity_ != kUnboundedCapacity; }
  bool SingleReader() const noexcept { return single_reader_; }

  ChannelStats GetStats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    ChannelStats s;
    s.written = written_;
    s.read = read_;
    s.write_waits = write_waits_;
    return s;
  }

 private:
  bool IsFullLocked() const noexcept {
    return capacity_ != kUnboundedCapacity &&
           items_.size() >= static_cast<size_t>(capacity_);
  }

  Fault CompletionFaultLocked() const {
    if (completion_.code == ErrorCode::kNone) {
      return Fault::Make(ErrorCode::kChannelClosed);
    }
    return completion_;
  }

  void WakeAll() {
    // Taking the lock orders the wakeup after a waiter's predicate check.
    { std::lock_guard<std::mutex> lk(mtx_); }
    readable_cv_.notify_all();
    writable_cv_.notify_all();
    drained_cv_.notify_all();
  }

  const uint32_t capacity_;
  const bool single_reader_;

  mutable std::mutex mtx_;
  std::condition_variable readable_cv_;
  std::condition_variable writable_cv_;
  std::condition_variable drained_cv_;

  std::deque<T> items_;
  bool completed_{false};
  Fault completion_{};

  uint64_t written_{0U};
  uint64_t read_{0U};
  uint64_t write_waits_{0U};
};

}  // namespace qpipe

#endif  // QPIPE_CHANNEL_HPP_
