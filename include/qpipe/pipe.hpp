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
 * @file pipe.hpp
 * @brief Channel-to-channel stages: concurrent reader, transform pipe, PipeTo.
 *
 *   Channel<TIn> --Read--> [worker] x K --transform--> Channel<TOut>
 *
 * A stage owns its workers; the returned PipeStage handle exposes the output
 * channel immediately and joins the workers when destroyed. Stages compose
 * by feeding one stage's Output() to the next Pipe().
 *
 * The output channel is always completed when the stage ends, carrying the
 * stage's fault if it faulted. A canceled stage completes its output
 * cleanly, so downstream stages finish with what was delivered. A source
 * that was completed with a fault faults the stage with that same Fault.
 * PipeTo differs: it forwards cancellation to its target as well.
 *
 * Usage:
 * @code
 *   auto a = qpipe::Pipe(input, 4, [](int v) { return v * 2; });
 *   auto b = qpipe::Pipe(a.Output(), 1, [](int v) { return std::to_string(v); });
 *   while (auto s = b.Output()->Read()) { ... }
 *   qpipe::CountResult n = b.Wait();
 * @endcode
 */

#ifndef QPIPE_PIPE_HPP_
#define QPIPE_PIPE_HPP_

#include "qpipe/cancel.hpp"
#include "qpipe/channel.hpp"
#include "qpipe/completion.hpp"
#include "qpipe/log.hpp"
#include "qpipe/vocabulary.hpp"
#include "qpipe/write_concurrently.hpp"

#include <cstdint>

#include <chrono>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace qpipe {

// ============================================================================
// PipeStage<T>
// ============================================================================

/**
 * @brief Handle to a running stage and its output channel.
 *
 * Move-only. Destroying a stage that is still running cancels it and waits
 * for its workers; a finished stage is destroyed without side effects.
 */
template <typename T>
class PipeStage final {
 public:
  PipeStage(std::shared_ptr<Channel<T>> output,
            std::shared_ptr<CancelSource> cancel, std::future<CountResult> done)
      : output_(std::move(output)),
        cancel_(std::move(cancel)),
        done_(done.share()) {}

  ~PipeStage() { Stop(); }

  PipeStage(const PipeStage&) = delete;
  PipeStage& operator=(const PipeStage&) = delete;

  PipeStage(PipeStage&&) noexcept = default;

  PipeStage& operator=(PipeStage&& other) noexcept {
    if (this != &other) {
      Stop();
      output_ = std::move(other.output_);
      cancel_ = std::move(other.cancel_);
      done_ = std::move(other.done_);
    }
    return *this;
  }

  /// @brief Output channel; readable as soon as the stage is created.
  const std::shared_ptr<Channel<T>>& Output() const noexcept { return output_; }

  /// @brief Block until the stage ends. May be called repeatedly.
  CountResult Wait() const {
    QPIPE_ASSERT(done_.valid());
    return done_.get();
  }

  bool IsDone() const {
    return done_.valid() && done_.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
  }

  /// @brief Cancel this stage only; upstream and downstream are unaffected.
  void Cancel() {
    if (cancel_ != nullptr) {
      (void)cancel_->Cancel();
    }
  }

 private:
  void Stop() noexcept {
    if (!done_.valid()) {
      return;
    }
    if (!IsDone()) {
      Cancel();
    }
    done_.wait();
  }

  std::shared_ptr<Channel<T>> output_;
  std::shared_ptr<CancelSource> cancel_;
  std::shared_future<CountResult> done_;
};

namespace detail {

/// @brief Transform results: plain TOut, or std::future<TOut> awaited inline.
template <typename R>
struct TransformTraits {
  using type = R;
  static R Resolve(R r) { return r; }
};

template <typename U>
struct TransformTraits<std::future<U>> {
  using type = U;
  static U Resolve(std::future<U> f) { return f.get(); }
};

template <typename Fn, typename TIn>
using TransformResultT = std::decay_t<std::invoke_result_t<Fn&, TIn&&>>;

template <typename Fn, typename TIn>
using TransformOutT = typename TransformTraits<TransformResultT<Fn, TIn>>::type;

/**
 * @brief One concurrent reader.
 *
 * Reads observe signal.Token() so a sibling's fault interrupts a blocked
 * read without losing an item. @p handler returns expected<void, Fault>;
 * a kCanceled error ends the worker as canceled, any other error faults.
 */
template <typename T, typename Handler>
WorkerOutcome ReadWorker(Channel<T>& source, Handler& handler,
                         FaultSignal& signal) {
  int64_t count = 0;
  try {
    while (!signal.ShouldStop()) {
      auto item = source.Read(signal.Token());
      if (!item.has_value()) {
        const Fault& f = item.get_error();
        if (f.IsClosed()) {
          return WorkerOutcome::Completed(count);
        }
        if (f.IsCanceled()) {
          return WorkerOutcome::Canceled(count);
        }
        (void)signal.Trip(f);
        return WorkerOutcome::Faulted(count);
      }
      expected<void, Fault> h = handler(std::move(item).value());
      if (!h.has_value()) {
        if (h.get_error().IsCanceled()) {
          return WorkerOutcome::Canceled(count);
        }
        (void)signal.Trip(h.get_error());
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

/// @brief Run @p workers readers over @p source and aggregate them.
template <typename T, typename Handler>
CountResult RunReaders(Channel<T>& source, uint32_t workers, Handler& handler,
                       const CancelToken& token) {
  FaultSignal signal(token);
  CompletionCoordinator coord(workers);
  coord.Run([&](uint32_t) { return ReadWorker(source, handler, signal); },
            signal);
  return coord.Aggregate(signal);
}

/// @brief Complete @p target carrying any error, cancellation included.
template <typename T>
bool CompleteForwarding(Channel<T>& target, const CountResult& result) {
  if (result.has_value()) {
    return target.Complete();
  }
  return target.Complete(result.get_error());
}

/// @brief Sequential source -> target drain used by PipeTo.
template <typename T>
CountResult DrainInto(Channel<T>& source, Channel<T>& target, bool complete,
                      const CancelToken& token) {
  int64_t count = 0;
  CountResult result = CountResult::success(0);
  for (;;) {
    auto item = source.Read(token);
    if (!item.has_value()) {
      const Fault& f = item.get_error();
      result = f.IsClosed() ? CountResult::success(count)
                            : CountResult::error(f);
      break;
    }
    auto w = WriteOne(target, std::move(item).value(), token);
    if (!w.has_value()) {
      result = CountResult::error(w.get_error());
      break;
    }
    ++count;
  }
  if (complete) {
    (void)CompleteForwarding(target, result);
  }
  return result;
}

/**
 * @brief A stage that ended before starting with @p code. Its output is
 *        completed as a stage ending that way would complete it.
 */
template <typename T>
PipeStage<T> FinishedStage(std::shared_ptr<Channel<T>> output,
                           std::shared_ptr<CancelSource> cancel, ErrorCode code,
                           const char* msg, bool forward_cancel = false) {
  const CountResult r = CountResult::error(Fault::Make(code, msg));
  if (output != nullptr) {
    (void)(forward_cancel ? CompleteForwarding(*output, r)
                          : CompleteWith(*output, r));
  }
  return PipeStage<T>(std::move(output), std::move(cancel), ReadyResult(r));
}

}  // namespace detail

// ============================================================================
// ReadAllConcurrently
// ============================================================================

/**
 * @brief Read every item of @p source with up to @p max_concurrency workers,
 *        passing each to @p receiver.
 *
 * @p receiver is called concurrently as receiver(T&&) and may throw; the
 * first exception faults the operation and stops the other readers.
 * @return Future of the number of items received, or the first fault.
 */
template <typename T, typename Receiver>
std::future<CountResult> ReadAllConcurrently(
    std::shared_ptr<Channel<T>> source, int32_t max_concurrency,
    Receiver receiver, CancelToken token = CancelToken::None()) {
  if (source == nullptr || !IsValidConcurrency(max_concurrency)) {
    QPIPE_LOG_ERROR("Pipe", "read_all_concurrently: bad arguments (k=%d)",
                    max_concurrency);
    return detail::ReadyFault(ErrorCode::kInvalidArgument,
                              "null source or max_concurrency < 1");
  }
  if (token.IsCancelRequested()) {
    return detail::ReadyFault(ErrorCode::kCanceled, "canceled before start");
  }
  const uint32_t workers = WorkerThreads(max_concurrency);
  return std::async(std::launch::async,
                    [source, workers, token, receiver]() mutable {
                      const uint64_t start_us = SteadyNowUs();
                      auto handler = [&receiver](T&& item) {
                        receiver(std::move(item));
                        return expected<void, Fault>::success();
                      };
                      CountResult r =
                          detail::RunReaders(*source, workers, handler, token);
                      detail::LogOutcome("Pipe", "read_all_concurrently", r,
                                         start_us);
                      return r;
                    });
}

// ============================================================================
// Pipe
// ============================================================================

/**
 * @brief Start a transform stage reading @p source.
 *
 * @param transform      TOut(TIn) or std::future<TOut>(TIn); called
 *                       concurrently when @p max_concurrency > 1.
 * @param capacity       Output capacity (kUnboundedCapacity = unbounded).
 * @param single_reader  Hint recorded on the output channel.
 * @return Stage whose output is completed when the source is drained, the
 *         stage faults (carrying the fault), or it is canceled (cleanly).
 */
template <typename TIn, typename Transform,
          typename TOut = detail::TransformOutT<Transform, TIn>>
PipeStage<TOut> Pipe(std::shared_ptr<Channel<TIn>> source,
                     int32_t max_concurrency, Transform transform,
                     uint32_t capacity = kUnboundedCapacity,
                     bool single_reader = false,
                     CancelToken token = CancelToken::None()) {
  using Traits = detail::TransformTraits<detail::TransformResultT<Transform, TIn>>;

  auto output = Channel<TOut>::Create(capacity, single_reader);
  auto cancel = std::make_shared<CancelSource>(CancelSource::CreateLinked(token));

  if (source == nullptr || !IsValidConcurrency(max_concurrency)) {
    QPIPE_LOG_ERROR("Pipe", "pipe: bad arguments (k=%d)", max_concurrency);
    return detail::FinishedStage(std::move(output), std::move(cancel),
                                 ErrorCode::kInvalidArgument,
                                 "null source or max_concurrency < 1");
  }
  const CancelToken stage_token = cancel->Token();
  if (stage_token.IsCancelRequested()) {
    return detail::FinishedStage(std::move(output), std::move(cancel),
                                 ErrorCode::kCanceled, "canceled before start");
  }

  const uint32_t workers = WorkerThreads(max_concurrency);
  QPIPE_LOG_DEBUG("Pipe", "stage start workers=%u (requested %d) capacity=%u",
                  workers, max_concurrency, capacity);
  std::future<CountResult> done = std::async(
      std::launch::async,
      [source, output, workers, stage_token, transform]() mutable {
        const uint64_t start_us = SteadyNowUs();
        auto handler = [&output, &transform,
                        &stage_token](TIn&& item) -> expected<void, Fault> {
          if (stage_token.IsCancelRequested()) {
            return expected<void, Fault>::error(
                Fault::Make(ErrorCode::kCanceled));
          }
          TOut value = Traits::Resolve(transform(std::move(item)));
          return detail::WriteOne(*output, std::move(value), stage_token);
        };
        CountResult r =
            detail::RunReaders(*source, workers, handler, stage_token);
        (void)CompleteWith(*output, r);
        detail::LogOutcome("Pipe", "pipe", r, start_us);
        return r;
      });
  return PipeStage<TOut>(std::move(output), std::move(cancel), std::move(done));
}

/// @brief Single-worker Pipe: output order matches @p source order.
template <typename TIn, typename Transform,
          typename TOut = detail::TransformOutT<Transform, TIn>>
PipeStage<TOut> Pipe(std::shared_ptr<Channel<TIn>> source, Transform transform,
                     uint32_t capacity = kUnboundedCapacity,
                     bool single_reader = false,
                     CancelToken token = CancelToken::None()) {
  return Pipe<TIn, Transform, TOut>(std::move(source), 1, std::move(transform),
                                    capacity, single_reader, std::move(token));
}

// ============================================================================
// PipeTo
// ============================================================================

/**
 * @brief Drain @p source into @p target in order.
 *
 * @param complete  Complete @p target when @p source is exhausted or the
 *                  drain stops, carrying the fault or cancellation if any.
 * @return Future of the number of items moved, or the terminal fault.
 */
template <typename T>
std::future<CountResult> PipeTo(std::shared_ptr<Channel<T>> source,
                                std::shared_ptr<Channel<T>> target,
                                bool complete,
                                CancelToken token = CancelToken::None()) {
  if (source == nullptr || target == nullptr) {
    QPIPE_LOG_ERROR("Pipe", "pipe_to: null source or target");
    return detail::ReadyFault(ErrorCode::kInvalidArgument,
                              "null source or target");
  }
  if (token.IsCancelRequested()) {
    return detail::ReadyFault(ErrorCode::kCanceled, "canceled before start");
  }
  return std::async(std::launch::async, [source, target, complete, token] {
    const uint64_t start_us = SteadyNowUs();
    CountResult r = detail::DrainInto(*source, *target, complete, token);
    detail::LogOutcome("Pipe", "pipe_to", r, start_us);
    return r;
  });
}

/**
 * @brief Drain @p source into @p target in the background, completing
 *        @p target when done. The returned stage's Output() is @p target.
 */
template <typename T>
PipeStage<T> PipeTo(std::shared_ptr<Channel<T>> source,
                    std::shared_ptr<Channel<T>> target,
                    CancelToken token = CancelToken::None()) {
  auto cancel = std::make_shared<CancelSource>(CancelSource::CreateLinked(token));
  if (source == nullptr || target == nullptr) {
    QPIPE_LOG_ERROR("Pipe", "pipe_to: null source or target");
    return detail::FinishedStage(std::move(target), std::move(cancel),
                                 ErrorCode::kInvalidArgument,
                                 "null source or target");
  }
  const CancelToken stage_token = cancel->Token();
  if (stage_token.IsCancelRequested()) {
    return detail::FinishedStage(std::move(target), std::move(cancel),
                                 ErrorCode::kCanceled, "canceled before start",
                                 true);
  }
  std::future<CountResult> done =
      std::async(std::launch::async, [source, target, stage_token] {
        const uint64_t start_us = SteadyNowUs();
        CountResult r = detail::DrainInto(*source, *target, true, stage_token);
        detail::LogOutcome("Pipe", "pipe_to", r, start_us);
        return r;
      });
  return PipeStage<T>(std::move(target), std::move(cancel), std::move(done));
}

}  // namespace qpipe

#endif  // QPIPE_PIPE_HPP_
