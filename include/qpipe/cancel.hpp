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
 * @file cancel.hpp
 * @brief Cooperative cancellation: CancelSource, CancelToken, registrations.
 *
 * A CancelSource owns a one-way "cancel requested" flag. CancelTokens are
 * cheap copies that observe it. Blocking primitives (Channel reads/writes)
 * register a wakeup callback on the token so Cancel() unblocks them
 * promptly instead of relying on polling.
 *
 * Linked sources (CreateLinked) cancel when their parent token cancels, or
 * when canceled directly; the parent is never affected by the child.
 *
 * Usage:
 * @code
 *   qpipe::CancelSource src;
 *   std::thread t([tok = src.Token()] {
 *     while (!tok.IsCancelRequested()) { ... }
 *   });
 *   src.Cancel();
 * @endcode
 */

#ifndef QPIPE_CANCEL_HPP_
#define QPIPE_CANCEL_HPP_

#include "qpipe/platform.hpp"
#include "qpipe/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace qpipe {

using CancelCallback = std::function<void()>;

namespace detail {

/**
 * @brief Shared state behind a CancelSource and its tokens.
 *
 * Callbacks are moved out of the list and run without the lock held.
 * Unregister() waits for a callback that is currently running on another
 * thread, so a registration owner may free what the callback touches as
 * soon as its CancelRegistration is destroyed.
 */
struct CancelState {
  std::atomic<bool> canceled{false};
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<std::pair<uint64_t, CancelCallback>> callbacks;
  uint64_t next_id{1U};
  bool running{false};
  std::thread::id running_thread{};

  /// @return 0 when already canceled (callback has been run inline).
  uint64_t Register(CancelCallback cb) {
    {
      std::lock_guard<std::mutex> lk(mtx);
      if (!canceled.load(std::memory_order_acquire)) {
        const uint64_t id = next_id++;
        callbacks.emplace_back(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0U;
  }

  void Unregister(uint64_t id) noexcept {
    std::unique_lock<std::mutex> lk(mtx);
    for (auto it = callbacks.begin(); it != callbacks.end(); ++it) {
      if (it->first == id) {
        callbacks.erase(it);
        return;
      }
    }
    // Not found: either never registered or taken by Cancel(). Wait out a
    // concurrent run unless we are the thread running the callbacks.
    if (running && running_thread != std::this_thread::get_id()) {
      cv.wait(lk, [this] { return !running; });
    }
  }

  /// @return true if this call performed the transition.
  bool Cancel() {
    std::vector<std::pair<uint64_t, CancelCallback>> to_run;
    {
      std::lock_guard<std::mutex> lk(mtx);
      if (canceled.load(std::memory_order_acquire)) {
        return false;
      }
      canceled.store(true, std::memory_order_release);
      to_run.swap(callbacks);
      running = true;
      running_thread = std::this_thread::get_id();
    }
    // A throwing callback must not leave Unregister() waiting forever.
    auto done = MakeScopeGuard([this] {
      {
        std::lock_guard<std::mutex> lk(mtx);
        running = false;
        running_thread = std::thread::id{};
      }
      cv.notify_all();
    });
    for (auto& entry : to_run) {
      entry.second();
    }
    return true;
  }
};

}  // namespace detail

// ============================================================================
// CancelRegistration
// ============================================================================

/**
 * @brief RAII handle for a callback registered on a CancelToken.
 *
 * Destruction unregisters; if the callback is running concurrently the
 * destructor blocks until it returns.
 */
class CancelRegistration final {
 public:
  CancelRegistration() noexcept = default;

  CancelRegistration(std::weak_ptr<detail::CancelState> state,
                     uint64_t id) noexcept
      : state_(std::move(state)), id_(id) {}

  ~CancelRegistration() { Reset(); }

  CancelRegistration(const CancelRegistration&) = delete;
  CancelRegistration& operator=(const CancelRegistration&) = delete;

  CancelRegistration(CancelRegistration&& other) noexcept
      : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0U;
  }

  CancelRegistration& operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
      Reset();
      state_ = std::move(other.state_);
      id_ = other.id_;
      other.id_ = 0U;
    }
    return *this;
  }

  void Reset() noexcept {
    if (id_ != 0U) {
      if (auto s = state_.lock()) {
        s->Unregister(id_);
      }
      id_ = 0U;
    }
    state_.reset();
  }

  bool IsActive() const noexcept { return id_ != 0U; }

 private:
  std::weak_ptr<detail::CancelState> state_;
  uint64_t id_{0U};
};

// ============================================================================
// CancelToken
// ============================================================================

/**
 * @brief Observer side of a CancelSource. Copyable, thread-safe.
 *
 * A default-constructed token (CancelToken::None()) can never be canceled.
 */
class CancelToken final {
 public:
  CancelToken() noexcept = default;

  static CancelToken None() noexcept { return CancelToken(); }

  bool IsCancelRequested() const noexcept {
    return state_ != nullptr &&
           state_->canceled.load(std::memory_order_acquire);
  }

  bool CanBeCanceled() const noexcept { return state_ != nullptr; }

  /**
   * @brief Register a callback to run once on cancellation.
   *
   * If cancellation was already requested the callback runs inline before
   * Register() returns and the returned registration is inactive.
   */
  CancelRegistration Register(CancelCallback cb) const {
    if (state_ == nullptr) {
      return CancelRegistration();
    }
    const uint64_t id = state_->Register(std::move(cb));
    if (id == 0U) {
      return CancelRegistration();
    }
    return CancelRegistration(state_, id);
  }

  /**
   * @brief Block until canceled or the timeout elapses.
   * @return true if cancellation was requested.
   */
  bool WaitFor(uint64_t timeout_us) const {
    if (state_ == nullptr) {
      std::this_thread::sleep_for(std::chrono::microseconds(timeout_us));
      return false;
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, std::chrono::microseconds(timeout_us), [this] {
      return state_->canceled.load(std::memory_order_acquire);
    });
  }

 private:
  friend class CancelSource;
  explicit CancelToken(std::shared_ptr<detail::CancelState> state) noexcept
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancelState> state_;
};

// ============================================================================
// CancelSource
// ============================================================================

/**
 * @brief Owner side of a cancellation flag. Movable, not copyable.
 */
class CancelSource final {
 public:
  CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

  ~CancelSource() = default;

  CancelSource(const CancelSource&) = delete;
  CancelSource& operator=(const CancelSource&) = delete;
  CancelSource(CancelSource&&) noexcept = default;
  CancelSource& operator=(CancelSource&&) noexcept = default;

  /**
   * @brief Create a source that also cancels when @p parent cancels.
   *
   * If the parent is already canceled the new source starts canceled.
   */
  static CancelSource CreateLinked(const CancelToken& parent) {
    CancelSource child;
    std::shared_ptr<detail::CancelState> state = child.state_;
    child.parent_reg_ = parent.Register([state] { (void)state->Cancel(); });
    return child;
  }

  /**
   * @brief Request cancellation. Idempotent.
   * @return true if this call performed the transition.
   */
  bool Cancel() { return state_->Cancel(); }

  bool IsCancelRequested() const noexcept {
    return state_->canceled.load(std::memory_order_acquire);
  }

  CancelToken Token() const noexcept { return CancelToken(state_); }

 private:
  std::shared_ptr<detail::CancelState> state_;
  CancelRegistration parent_reg_;
};

}  // namespace qpipe

#endif  // QPIPE_CANCEL_HPP_
