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
 * @file write_concurrently.hpp
 * @brief Bounded-concurrency fan-out writer: item sequence -> Channel<T>.
 *
 *   ItemSource --SharedCursor--> [worker] x K --TryWrite/Write--> Channel<T>
 *
 * Each item of the source is a std::future<T>; a worker that pulls one waits
 * for its value and writes it to the target. With max_concurrency == 1 the
 * source is drained on a single thread in order. Above 1 every item lands
 * exactly once but landing order is unspecified.
 *
 * Usage:
 * @code
 *   auto ch = qpipe::Channel<int>::Create(16U);
 *   auto src = qpipe::MakeValueSource(values.begin(), values.end());
 *   auto done = qpipe::WriteAllConcurrently(ch, 4, std::move(src), true);
 *   qpipe::CountResult r = done.get();
 * @endcode
 */

#ifndef QPIPE_WRITE_CONCURRENTLY_HPP_
#define QPIPE_WRITE_CONCURRENTLY_HPP_

#include "qpipe/cancel.hpp"
#include "qpipe/channel.hpp"
#include "qpipe/completion.hpp"
#include "qpipe/log.hpp"
#include "qpipe/shared_cursor.hpp"
#include "qpipe/vocabulary.hpp"

#include <cstdint>

#include <future>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace qpipe {

/// @brief A lazily advanced sequence of asynchronously produced items.
template <typename T>
using ItemSource = PullFn<std::future<T>>;

// ============================================================================
// Source factories
// ============================================================================

namespace detail {

/// @brief T of a range whose elements are std::future<T>.
template <typename Iter>
using FutureValueT = decltype(
    std::declval<typename std::iterator_traits<Iter>::value_type&>().get());

/// @brief Result type of a range of producer callables.
template <typename Iter>
using ProducerResultT = std::decay_t<
    std::invoke_result_t<typename std::iterator_traits<Iter>::value_type&>>;

}  // namespace detail

/**
 * @brief Source over a range of futures. Each future is moved out when
 *        pulled; the range must outlive the operation.
 */
template <typename Iter>
auto MakeFutureSource(Iter first, Iter last)
    -> ItemSource<detail::FutureValueT<Iter>> {
  using T = detail::FutureValueT<Iter>;
  return ItemSource<T>([first, last](std::future<T>* out) mutable {
    if (first == last) {
      return false;
    }
    *out = std::move(*first);
    ++first;
    return true;
  });
}

/**
 * @brief Source over a range of producer callables.
 *
 * A producer is not invoked when pulled but when the receiving worker waits
 * on the item, so producers run concurrently across workers.
 */
template <typename Iter>
auto MakeDeferredSource(Iter first, Iter last)
    -> ItemSource<detail::ProducerResultT<Iter>> {
  using Fn = typename std::iterator_traits<Iter>::value_type;
  using T = detail::ProducerResultT<Iter>;
  return ItemSource<T>([first, last](std::future<T>* out) mutable {
    if (first == last) {
      return false;
    }
    Fn fn = *first;
    ++first;
    *out = std::async(std::launch::deferred, std::move(fn));
    return true;
  });
}

/// @brief Source over a range of plain values (already-ready items).
template <typename Iter>
auto MakeValueSource(Iter first, Iter last)
    -> ItemSource<typename std::iterator_traits<Iter>::value_type> {
  using T = typename std::iterator_traits<Iter>::value_type;
  return ItemSource<T>([first, last](std::future<T>* out) mutable {
    if (first == last) {
      return false;
    }
    std::promise<T> p;
    p.set_value(*first);
    ++first;
    *out = p.get_future();
    return true;
  });
}

namespace detail {

/// @brief Blocks template argument deduction through a parameter.
template <typename X>
struct Identity {
  using type = X;
};

inline std::future<CountResult> ReadyResult(CountResult result) {
  std::promise<CountResult> p;
  p.set_value(std::move(result));
  return p.get_future();
}

inline std::future<CountResult> ReadyFault(ErrorCode code, const char* msg) {
  return ReadyResult(CountResult::error(Fault::Make(code, msg)));
}

/**
 * @brief Write one value: TryWrite first, then a blocking Write observing
 *        @p token only.
 */
template <typename T>
expected<void, Fault> WriteOne(Channel<T>& target, T&& value,
                               const CancelToken& token) {
  // TryWrite leaves the value intact on failure.
  if (target.TryWrite(std::move(value))) {
    return expected<void, Fault>::success();
  }
  return target.Write(std::move(value), token);
}

/// @brief Call-time checks shared by WriteAll and WriteAllConcurrently.
template <typename T>
bool CheckWriteArgs(const std::shared_ptr<Channel<T>>& target,
                    const ItemSource<T>& source, const CancelToken& token,
                    std::future<CountResult>* early) {
  if (target == nullptr || !source) {
    QPIPE_LOG_ERROR("Fanout", "null target or empty source");
    *early = ReadyFault(ErrorCode::kInvalidArgument, "null target or source");
    return false;
  }
  if (token.IsCancelRequested()) {
    QPIPE_LOG_DEBUG("Fanout", "canceled before start");
    *early = ReadyFault(ErrorCode::kCanceled, "canceled before start");
    return false;
  }
  if (!target->IsWritable()) {
    QPIPE_LOG_WARN("Fanout", "target closed before writing could begin");
    *early = ReadyFault(ErrorCode::kTargetClosed,
                        "target closed before writing could begin");
    return false;
  }
  return true;
}

/// @brief Sequential drain, run on the coordinator thread.
template <typename T>
CountResult WriteAllSync(Channel<T>& target, ItemSource<T>& source,
                         bool complete, const CancelToken& token) {
  int64_t count = 0;
  CountResult result = CountResult::success(0);
  try {
    bool exhausted = false;
    while (!token.IsCancelRequested()) {
      std::future<T> item;
      if (!source(&item)) {
        exhausted = true;
        break;
      }
      T value = item.get();
      auto w = WriteOne(target, std::move(value), token);
      if (!w.has_value()) {
        result = CountResult::error(w.get_error());
        break;
      }
      ++count;
    }
    if (result.has_value()) {
      result = exhausted
                   ? CountResult::success(count)
                   : CountResult::error(Fault::Make(ErrorCode::kCanceled));
    }
  } catch (const std::exception& e) {
    QPIPE_LOG_WARN("Fanout", "item %lld raised: %s",
                   static_cast<long long>(count), e.what());
    result = CountResult::error(Fault::FromCurrentException());
  } catch (...) {
    QPIPE_LOG_WARN("Fanout", "item %lld raised a non-standard exception",
                   static_cast<long long>(count));
    result = CountResult::error(Fault::FromCurrentException());
  }
  if (complete) {
    (void)CompleteWith(target, result);
  }
  return result;
}

/**
 * @brief One fan-out worker.
 *
 * Leaves on exhaustion (completed), on the signal or caller token
 * (canceled), or on its own fault (trips the signal).
 */
template <typename T>
WorkerOutcome WriteWorker(Channel<T>& target, SharedCursor<std::future<T>>& cursor,
                          FaultSignal& signal) {
  int64_t count = 0;
  try {
    while (!signal.ShouldStop()) {
      std::future<T> item;
      if (!cursor.TryAdvance(&item)) {
        return WorkerOutcome::Completed(count);
      }
      T value = item.get();
      auto w = WriteOne(target, std::move(value), signal.External());
      if (!w.has_value()) {
        if (w.get_error().IsCanceled()) {
          return WorkerOutcome::Canceled(count);
        }
        (void)signal.Trip(w.get_error());
        return WorkerOutcome::Faulted(count);
      }
      ++count;
    }
  } catch (...) {
    (void)signal.Trip(Fault::FromCurrentException());
    return WorkerOutcome::Faulted(count);
  }
  return WorkerOutcome::Canceled(count);
}

}  // namespace detail

// ============================================================================
// WriteAll
// ============================================================================

/**
 * @brief Write every item of @p source to @p target in source order.
 *
 * @param complete  Complete @p target when done, carrying the fault if any.
 * @return Future of the number of items written, or the terminal fault.
 */
template <typename T>
std::future<CountResult> WriteAll(
    std::shared_ptr<Channel<T>> target,
    typename detail::Identity<ItemSource<T>>::type source,
    bool complete = false, CancelToken token = CancelToken::None()) {
  std::future<CountResult> early;
  if (!detail::CheckWriteArgs(target, source, token, &early)) {
    return early;
  }
  return std::async(
      std::launch::async,
      [target, complete, token](ItemSource<T> src) {
        const uint64_t start_us = SteadyNowUs();
        CountResult r = detail::WriteAllSync(*target, src, complete, token);
        detail::LogOutcome("Fanout", "write_all", r, start_us);
        return r;
      },
      std::move(source));
}

// ============================================================================
// WriteAllConcurrently
// ============================================================================

/**
 * @brief Drain @p source into @p target with up to @p max_concurrency
 *        concurrent workers.
 *
 * Argument errors, a pre-canceled @p token and a completed target resolve
 * immediately without invoking @p source. The first fault stops all workers
 * from taking new items; items already pulled are still written.
 *
 * @param max_concurrency  >= 1. At most QPIPE_MAX_CONCURRENCY threads are
 *                         spawned; a larger value shares them.
 * @param complete         Complete @p target when done, carrying the fault
 *                         if one occurred. Cancellation completes cleanly.
 * @return Future of the total items written, or the first fault.
 */
template <typename T>
std::future<CountResult> WriteAllConcurrently(
    std::shared_ptr<Channel<T>> target, int32_t max_concurrency,
    typename detail::Identity<ItemSource<T>>::type source, bool complete = false,
    CancelToken token = CancelToken::None()) {
  if (!IsValidConcurrency(max_concurrency)) {
    QPIPE_LOG_ERROR("Fanout", "max_concurrency %d must be >= 1",
                    max_concurrency);
    return detail::ReadyFault(ErrorCode::kInvalidArgument,
                              "max_concurrency must be >= 1");
  }
  if (max_concurrency == 1) {
    return WriteAll(std::move(target), std::move(source), complete,
                    std::move(token));
  }
  std::future<CountResult> early;
  if (!detail::CheckWriteArgs(target, source, token, &early)) {
    return early;
  }

  const uint32_t workers = WorkerThreads(max_concurrency);
  QPIPE_LOG_DEBUG("Fanout", "start workers=%u (requested %d)", workers,
                  max_concurrency);
  return std::async(
      std::launch::async,
      [target, workers, complete, token](ItemSource<T> src) {
        const uint64_t start_us = SteadyNowUs();
        SharedCursor<std::future<T>> cursor(std::move(src));
        FaultSignal signal(token);
        CompletionCoordinator coord(workers);
        coord.Run(
            [&](uint32_t) {
              return detail::WriteWorker(*target, cursor, signal);
            },
            signal);
        CountResult r = coord.Aggregate(signal);
        if (complete) {
          (void)CompleteWith(*target, r);
        }
        detail::LogOutcome("Fanout", "write_all_concurrently", r,
                           start_us);
        return r;
      },
      std::move(source));
}

/// @brief Range overload: each element of [first, last) is a std::future<T>.
template <typename T, typename Iter>
std::future<CountResult> WriteAllConcurrently(
    std::shared_ptr<Channel<T>> target, int32_t max_concurrency, Iter first,
    Iter last, bool complete = false, CancelToken token = CancelToken::None()) {
  return WriteAllConcurrently(std::move(target), max_concurrency,
                              ItemSource<T>(MakeFutureSource(first, last)),
                              complete, std::move(token));
}

}  // namespace qpipe

#endif  // QPIPE_WRITE_CONCURRENTLY_HPP_
