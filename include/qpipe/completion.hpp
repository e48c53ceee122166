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
 * @file completion.hpp
 * @brief Worker-pool join logic shared by the fan-out writer and pipe stages.
 *
 * Pieces:
 *   FaultSignal            - per-call, first-fault-wins stop flag for siblings
 *   WorkerOutcome          - what a single worker reports when it returns
 *   CompletionCoordinator  - spawns K worker threads, joins them, and folds
 *                            their outcomes into one CountResult
 *
 * Aggregation precedence: fault > canceled > summed count.
 */

#ifndef QPIPE_COMPLETION_HPP_
#define QPIPE_COMPLETION_HPP_

#include "qpipe/cancel.hpp"
#include "qpipe/log.hpp"
#include "qpipe/platform.hpp"
#include "qpipe/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

// ============================================================================
// Compile-time configuration
// ============================================================================

/// @brief Upper bound on threads a single call spawns. A larger
/// max_concurrency is accepted; its workers then share this many threads.
#ifndef QPIPE_MAX_CONCURRENCY
#define QPIPE_MAX_CONCURRENCY 256
#endif

namespace qpipe {

/// @brief Item count or the terminal fault of an operation.
using CountResult = expected<int64_t, Fault>;

// ============================================================================
// FaultSignal
// ============================================================================

/**
 * @brief Set-once stop flag derived from the caller's cancellation token.
 *
 * Trip() records the first fault and cancels the derived token. Token()
 * fires on either the caller's cancellation or a trip and is meant for
 * operations that are safe to interrupt (reads). External() is the
 * caller's own token, used for writes so in-flight items still land.
 */
class FaultSignal final {
 public:
  explicit FaultSignal(const CancelToken& external)
      : external_(external), derived_(CancelSource::CreateLinked(external)) {}

  FaultSignal(const FaultSignal&) = delete;
  FaultSignal& operator=(const FaultSignal&) = delete;

  /**
   * @brief Record @p fault and stop all siblings.
   * @return true if this call was the first to trip the signal.
   */
  bool Trip(const Fault& fault) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (tripped_.load(std::memory_order_relaxed)) {
        return false;
      }
      fault_ = fault;
      tripped_.store(true, std::memory_order_release);
    }
    (void)derived_.Cancel();
    return true;
  }

  bool IsTripped() const noexcept {
    return tripped_.load(std::memory_order_acquire);
  }

  /// @brief Checked at the top of every worker iteration.
  bool ShouldStop() const noexcept {
    return IsTripped() || external_.IsCancelRequested();
  }

  /// @brief The first recorded fault (code kNone if never tripped).
  Fault GetFault() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return fault_;
  }

  CancelToken Token() const noexcept { return derived_.Token(); }
  const CancelToken& External() const noexcept { return external_; }

 private:
  CancelToken external_;
  CancelSource derived_;
  mutable std::mutex mtx_;
  Fault fault_{};
  std::atomic<bool> tripped_{false};
};

// ============================================================================
// WorkerOutcome
// ============================================================================

enum class WorkerState : uint8_t {
  kPending = 0,  ///< Not run (spawn failed)
  kCompleted,    ///< Observed natural exhaustion
  kCanceled,     ///< Stopped by the caller's token or a sibling's fault
  kFaulted,      ///< Own fault; recorded in the FaultSignal
};

struct WorkerOutcome {
  WorkerState state{WorkerState::kPending};
  int64_t count{0};

  static WorkerOutcome Completed(int64_t n) noexcept {
    return WorkerOutcome{WorkerState::kCompleted, n};
  }
  static WorkerOutcome Canceled(int64_t n) noexcept {
    return WorkerOutcome{WorkerState::kCanceled, n};
  }
  static WorkerOutcome Faulted(int64_t n) noexcept {
    return WorkerOutcome{WorkerState::kFaulted, n};
  }
};

// ============================================================================
// CompletionCoordinator
// ============================================================================

/**
 * @brief Runs K workers on their own threads and aggregates their outcomes.
 *
 * Usage:
 * @code
 *   qpipe::FaultSignal signal(token);
 *   qpipe::CompletionCoordinator coord(4U);
 *   coord.Run([&](uint32_t id) { return Work(id, signal); }, signal);
 *   qpipe::CountResult r = coord.Aggregate(signal);
 * @endcode
 */
class CompletionCoordinator final {
 public:
  explicit CompletionCoordinator(uint32_t worker_count)
      : outcomes_(worker_count) {}

  CompletionCoordinator(const CompletionCoordinator&) = delete;
  CompletionCoordinator& operator=(const CompletionCoordinator&) = delete;

  uint32_t WorkerCount() const noexcept {
    return static_cast<uint32_t>(outcomes_.size());
  }

  /**
   * @brief Spawn one thread per worker, then join them all.
   *
   * @p fn is called as fn(worker_id) and must return a WorkerOutcome
   * without throwing. If a thread cannot be created the signal is tripped
   * so the workers already running wind down, and the remaining slots stay
   * kPending.
   */
  template <typename WorkerFn>
  void Run(WorkerFn fn, FaultSignal& signal) {
    std::vector<std::thread> threads;
    threads.reserve(outcomes_.size());
    for (uint32_t i = 0U; i < WorkerCount(); ++i) {
      try {
        threads.emplace_back([this, i, &fn] { outcomes_[i] = fn(i); });
      } catch (const std::system_error&) {
        QPIPE_LOG_ERROR("Completion", "failed to spawn worker %u of %u", i,
                        WorkerCount());
        (void)signal.Trip(Fault::FromCurrentException());
        break;
      }
    }
    for (auto& t : threads) {
      t.join();
    }
  }

  const WorkerOutcome& Outcome(uint32_t worker_id) const {
    QPIPE_ASSERT(worker_id < WorkerCount());
    return outcomes_[worker_id];
  }

  /// @brief Sum of per-worker counts (valid after Run()).
  int64_t TotalCount() const noexcept {
    int64_t total = 0;
    for (const auto& o : outcomes_) {
      total += o.count;
    }
    return total;
  }

  /**
   * @brief Fold all outcomes into one result.
   *
   * Any fault (the signal's first recorded one) wins; otherwise any
   * canceled worker makes the whole operation canceled; otherwise the
   * summed count.
   */
  CountResult Aggregate(const FaultSignal& signal) const {
    if (signal.IsTripped()) {
      return CountResult::error(signal.GetFault());
    }
    for (const auto& o : outcomes_) {
      if (o.state == WorkerState::kFaulted) {
        return CountResult::error(Fault::Make(ErrorCode::kFaulted));
      }
    }
    for (const auto& o : outcomes_) {
      if (o.state == WorkerState::kCanceled ||
          o.state == WorkerState::kPending) {
        return CountResult::error(Fault::Make(ErrorCode::kCanceled));
      }
    }
    return CountResult::success(TotalCount());
  }

 private:
  std::vector<WorkerOutcome> outcomes_;
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Complete @p channel according to @p result.
 *
 * A fault is carried by the completion so readers see the failure instead
 * of a silent truncation. Success and cancellation complete cleanly:
 * cancellation belongs to the caller that requested it, not to downstream
 * readers.
 * @return false if the channel had already been completed.
 */
template <typename ChannelT>
bool CompleteWith(ChannelT& channel, const CountResult& result) {
  if (result.has_value() || result.get_error().IsCanceled()) {
    return channel.Complete();
  }
  return channel.Complete(result.get_error());
}

/// @brief Common argument check for concurrent entry points.
inline bool IsValidConcurrency(int32_t max_concurrency) noexcept {
  return max_concurrency >= 1;
}

/// @brief Threads to spawn for a valid @p max_concurrency.
inline uint32_t WorkerThreads(int32_t max_concurrency) noexcept {
  return max_concurrency > QPIPE_MAX_CONCURRENCY
             ? static_cast<uint32_t>(QPIPE_MAX_CONCURRENCY)
             : static_cast<uint32_t>(max_concurrency);
}

namespace detail {

/// @brief Log the end of an operation started at @p start_us (SteadyNowUs).
inline void LogOutcome(const char* category, const char* what,
                       const CountResult& r, uint64_t start_us) {
  const unsigned long long elapsed_us =
      static_cast<unsigned long long>(SteadyNowUs() - start_us);
  if (r.has_value()) {
    QPIPE_LOG_DEBUG(category, "%s done count=%lld in %lluus", what,
                    static_cast<long long>(r.value()), elapsed_us);
  } else if (r.get_error().IsCanceled()) {
    QPIPE_LOG_DEBUG(category, "%s canceled after %lluus", what, elapsed_us);
  } else {
    QPIPE_LOG_WARN(category, "%s failed: %s (%s)", what,
                   ErrorCodeName(r.get_error().code), r.get_error().message);
  }
}

}  // namespace detail

}  // namespace qpipe

#endif  // QPIPE_COMPLETION_HPP_
