// Copyright (c) 2024 liudegui. MIT License.
//
// pipeline_demo.cpp -- Pipe / PipeTo / ReadAllConcurrently demo.
//
// Demonstrates:
//   1. Two chained transform stages (parse -> scale) feeding PipeTo
//   2. A bounded stage applying backpressure to its transform workers
//   3. Fault propagation from the first stage to the end of the chain
//   4. Cancelling a running stage

#include "qpipe/channel.hpp"
#include "qpipe/log.hpp"
#include "qpipe/pipe.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

static std::shared_ptr<qpipe::Channel<std::string>> MakeLines(int n,
                                                              bool complete) {
  auto ch = qpipe::Channel<std::string>::Create();
  for (int i = 0; i < n; ++i) {
    (void)ch->TryWrite(std::to_string(i));
  }
  if (complete) ch->Complete();
  return ch;
}

// ============================================================================
// Demo 1: Chained Stages
// ============================================================================

static void DemoChain() {
  printf("\n=== Demo 1: Chained Stages ===\n");
  auto lines = MakeLines(20, true);

  auto parsed = qpipe::Pipe(lines, 4, [](std::string&& s) {
    return std::atoi(s.c_str());
  });
  auto scaled = qpipe::Pipe(parsed.Output(), 2, [](int&& v) {
    return static_cast<double>(v) * 0.5;
  });

  auto sink = qpipe::Channel<double>::Create();
  auto moved = qpipe::PipeTo(scaled.Output(), sink, true).get();

  double total = 0.0;
  double v = 0.0;
  while (sink->TryRead(&v)) total += v;
  printf("  moved=%lld total=%.1f parse=%s scale=%s\n",
         static_cast<long long>(moved.value_or(-1)), total,
         parsed.Wait().has_value() ? "ok" : "err",
         scaled.Wait().has_value() ? "ok" : "err");
}

// ============================================================================
// Demo 2: Backpressure
// ============================================================================

static void DemoBackpressure() {
  printf("\n=== Demo 2: Bounded Stage Backpressure ===\n");
  auto lines = MakeLines(64, true);
  std::atomic<uint32_t> transformed{0};

  auto stage = qpipe::Pipe(
      lines, 4,
      [&transformed](std::string&& s) {
        transformed.fetch_add(1, std::memory_order_relaxed);
        return s.size();
      },
      8U);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  printf("  stalled: transformed=%u buffered=%zu capacity=%u\n",
         transformed.load(), stage.Output()->Size(),
         stage.Output()->Capacity());

  std::atomic<uint64_t> bytes{0};
  auto r = qpipe::ReadAllConcurrently(stage.Output(), 2, [&bytes](size_t n) {
             bytes.fetch_add(n, std::memory_order_relaxed);
           }).get();
  printf("  drained=%lld bytes=%llu\n",
         static_cast<long long>(r.value_or(-1)),
         static_cast<unsigned long long>(bytes.load()));
}

// ============================================================================
// Demo 3: Fault Propagation
// ============================================================================

static void DemoFault() {
  printf("\n=== Demo 3: Fault Propagation ===\n");
  auto lines = MakeLines(10, true);

  auto parsed = qpipe::Pipe(lines, 2, [](std::string&& s) {
    if (s == "7") throw std::invalid_argument("bad record 7");
    return std::atoi(s.c_str());
  });
  auto doubled = qpipe::Pipe(parsed.Output(), 2, [](int&& v) { return v * 2; });

  auto r = doubled.Wait();
  printf("  last stage: %s\n",
         r.has_value() ? "ok" : qpipe::ErrorCodeName(r.get_error().code));
  try {
    doubled.Output()->CompletionFault().Rethrow();
  } catch (const std::exception& e) {
    printf("  rethrown at the end of the chain: %s\n", e.what());
  }
}

// ============================================================================
// Demo 4: Cancel
// ============================================================================

static void DemoCancel() {
  printf("\n=== Demo 4: Cancel a Running Stage ===\n");
  auto lines = MakeLines(5, false);  // never completed: the stage would wait

  auto stage = qpipe::Pipe(lines, 2, [](std::string&& s) { return s + "!"; });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  printf("  done before cancel=%d\n", stage.IsDone() ? 1 : 0);

  stage.Cancel();
  auto r = stage.Wait();
  printf("  result=%s output completed=%d fault=%s\n",
         r.has_value() ? "ok" : qpipe::ErrorCodeName(r.get_error().code),
         stage.Output()->IsCompleted() ? 1 : 0,
         qpipe::ErrorCodeName(stage.Output()->CompletionFault().code));
}

int main() {
  qpipe::log::Init();
  QPIPE_LOG_INFO("Demo", "pipeline demo start");

  DemoChain();
  DemoBackpressure();
  DemoFault();
  DemoCancel();

  QPIPE_LOG_INFO("Demo", "pipeline demo done");
  qpipe::log::Shutdown();
  return 0;
}
