// Copyright (c) 2024 liudegui. MIT License.
//
// fanout_demo.cpp -- WriteAllConcurrently demo.
//
// Demonstrates:
//   1. Deferred producers written by 1/2/4/8 workers (timing comparison)
//   2. A failing producer faulting the target channel
//   3. Cancellation of a writer blocked on a full bounded channel

#include "qpipe/channel.hpp"
#include "qpipe/log.hpp"
#include "qpipe/write_concurrently.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

// ============================================================================
// Timing Helpers
// ============================================================================

using Clock = std::chrono::steady_clock;

static inline uint64_t ElapsedMs(Clock::time_point t0, Clock::time_point t1) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());
}

static std::vector<std::function<int()>> MakeProducers(int n, int delay_ms) {
  std::vector<std::function<int()>> producers;
  producers.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    producers.emplace_back([i, delay_ms] {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      return i * i;
    });
  }
  return producers;
}

// ============================================================================
// Demo 1: Worker Scaling
// ============================================================================

static void DemoScaling() {
  printf("\n=== Demo 1: Worker Scaling (32 producers x 5ms) ===\n");
  const int32_t kWorkers[] = {1, 2, 4, 8};
  for (int32_t k : kWorkers) {
    auto producers = MakeProducers(32, 5);
    auto target = qpipe::Channel<int>::Create();

    auto t0 = Clock::now();
    auto r = qpipe::WriteAllConcurrently(
                 target, k,
                 qpipe::MakeDeferredSource(producers.begin(), producers.end()),
                 true)
                 .get();
    auto t1 = Clock::now();

    int64_t sum = 0;
    int v = 0;
    while (target->TryRead(&v)) sum += v;
    printf("  workers=%d written=%lld sum=%lld elapsed=%llums\n", k,
           static_cast<long long>(r.value_or(-1)),
           static_cast<long long>(sum),
           static_cast<unsigned long long>(ElapsedMs(t0, t1)));
  }
}

// ============================================================================
// Demo 2: Producer Fault
// ============================================================================

static void DemoFault() {
  printf("\n=== Demo 2: Producer Fault ===\n");
  std::vector<std::function<int()>> producers = MakeProducers(10, 1);
  producers[3] = []() -> int { throw std::runtime_error("sensor offline"); };

  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(
               target, 4,
               qpipe::MakeDeferredSource(producers.begin(), producers.end()),
               true)
               .get();

  if (!r.has_value()) {
    printf("  result: %s (%s)\n", qpipe::ErrorCodeName(r.get_error().code),
           r.get_error().message);
  }
  printf("  target completed=%d fault=%s items landed=%zu\n",
         target->IsCompleted() ? 1 : 0,
         qpipe::ErrorCodeName(target->CompletionFault().code),
         target->Size());
  try {
    target->CompletionFault().Rethrow();
  } catch (const std::exception& e) {
    printf("  rethrown: %s\n", e.what());
  }
}

// ============================================================================
// Demo 3: Cancel a Blocked Writer
// ============================================================================

static void DemoCancel() {
  printf("\n=== Demo 3: Cancel Blocked Writer ===\n");
  std::vector<int> values;
  for (int i = 0; i < 100; ++i) values.push_back(i);

  auto target = qpipe::Channel<int>::Create(4U);
  qpipe::CancelSource cancel;
  auto done = qpipe::WriteAllConcurrently(
      target, 2, qpipe::MakeValueSource(values.begin(), values.end()), false,
      cancel.Token());

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  printf("  before cancel: buffered=%zu capacity=%u\n", target->Size(),
         target->Capacity());
  cancel.Cancel();
  auto r = done.get();
  printf("  result: %s\n",
         r.has_value() ? "ok" : qpipe::ErrorCodeName(r.get_error().code));
  printf("  target completed=%d (caller still owns it)\n",
         target->IsCompleted() ? 1 : 0);
}

int main() {
  qpipe::log::Init();
  QPIPE_LOG_INFO("Demo", "fanout demo start");

  DemoScaling();
  DemoFault();
  DemoCancel();

  QPIPE_LOG_INFO("Demo", "fanout demo done");
  qpipe::log::Shutdown();
  return 0;
}
