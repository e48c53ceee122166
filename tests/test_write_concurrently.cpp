/**
 * @file test_write_concurrently.cpp
 * @brief Catch2 tests for qpipe::WriteAll / qpipe::WriteAllConcurrently.
 */

#include "qpipe/write_concurrently.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<int> Iota(int n) {
  std::vector<int> v;
  v.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    v.push_back(i);
  }
  return v;
}

/// Drain a completed channel into a vector.
template <typename T>
std::vector<T> DrainAll(qpipe::Channel<T>& ch) {
  std::vector<T> out;
  T v{};
  while (ch.TryRead(&v)) {
    out.push_back(v);
  }
  return out;
}

/// Source that counts how many times it was pulled.
qpipe::ItemSource<int> CountedSource(const std::vector<int>& values,
                                     std::atomic<int>* pulls) {
  auto inner = qpipe::MakeValueSource(values.begin(), values.end());
  return [inner, pulls](std::future<int>* out) mutable {
    pulls->fetch_add(1);
    return inner(out);
  };
}

}  // namespace

// ============================================================================
// Ordering and counts
// ============================================================================

TEST_CASE("write_concurrently - concurrency 1 preserves source order",
          "[write_concurrently]") {
  const auto values = Iota(200);
  auto target = qpipe::Channel<int>::Create();
  auto done = qpipe::WriteAllConcurrently(
      target, 1, qpipe::MakeValueSource(values.begin(), values.end()), true);
  auto r = done.get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 200);
  REQUIRE(target->IsCompleted());
  REQUIRE(DrainAll(*target) == values);
}

TEST_CASE("write_concurrently - K workers deliver every item exactly once",
          "[write_concurrently]") {
  const auto values = Iota(2000);
  auto target = qpipe::Channel<int>::Create();
  auto done = qpipe::WriteAllConcurrently(
      target, 8, qpipe::MakeValueSource(values.begin(), values.end()), true);
  auto r = done.get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 2000);

  auto got = DrainAll(*target);
  REQUIRE(got.size() == values.size());
  std::set<int> unique(got.begin(), got.end());
  REQUIRE(unique.size() == values.size());
  REQUIRE(*unique.begin() == 0);
  REQUIRE(*unique.rbegin() == 1999);
}

TEST_CASE("write_concurrently - concurrency above the thread cap is accepted",
          "[write_concurrently]") {
  const auto values = Iota(1000);
  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(
               target, QPIPE_MAX_CONCURRENCY + 44,
               qpipe::MakeValueSource(values.begin(), values.end()), true)
               .get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1000);
  REQUIRE(target->IsCompleted());
  REQUIRE(target->CompletionFault().code == qpipe::ErrorCode::kNone);

  auto got = DrainAll(*target);
  std::set<int> unique(got.begin(), got.end());
  REQUIRE(got.size() == 1000U);
  REQUIRE(unique.size() == 1000U);
}

TEST_CASE("write_concurrently - bounded target with a live reader",
          "[write_concurrently]") {
  const auto values = Iota(500);
  auto target = qpipe::Channel<int>::Create(4U);
  std::atomic<int> received{0};
  std::thread reader([&] {
    while (target->Read().has_value()) {
      received.fetch_add(1);
    }
  });
  auto r = qpipe::WriteAllConcurrently(
               target, 4, qpipe::MakeValueSource(values.begin(), values.end()),
               true)
               .get();
  reader.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 500);
  REQUIRE(received.load() == 500);
}

TEST_CASE("write_concurrently - empty source succeeds with zero",
          "[write_concurrently]") {
  const std::vector<int> none;
  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(
               target, 3, qpipe::MakeValueSource(none.begin(), none.end()),
               true)
               .get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0);
  REQUIRE(target->IsDrained());
  REQUIRE(target->CompletionFault().code == qpipe::ErrorCode::kNone);
}

TEST_CASE("write_concurrently - complete=false leaves target open",
          "[write_concurrently]") {
  const auto values = Iota(10);
  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(
               target, 2, qpipe::MakeValueSource(values.begin(), values.end()))
               .get();
  REQUIRE(r.value() == 10);
  REQUIRE(target->IsWritable());
}

TEST_CASE("write_concurrently - range overload over futures",
          "[write_concurrently]") {
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 50; ++i) {
    futures.push_back(std::async(std::launch::async, [i] { return i * i; }));
  }
  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(target, 4, futures.begin(),
                                       futures.end(), true)
               .get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 50);
  auto got = DrainAll(*target);
  std::set<int> unique(got.begin(), got.end());
  REQUIRE(unique.size() == 50U);
  REQUIRE(unique.count(49 * 49) == 1U);
}

TEST_CASE("write_concurrently - deferred producers run on workers",
          "[write_concurrently]") {
  std::atomic<int> produced{0};
  std::vector<std::function<std::string()>> producers;
  for (int i = 0; i < 20; ++i) {
    producers.emplace_back([i, &produced] {
      produced.fetch_add(1);
      return std::to_string(i);
    });
  }
  auto source = qpipe::MakeDeferredSource(producers.begin(), producers.end());
  REQUIRE(produced.load() == 0);

  auto target = qpipe::Channel<std::string>::Create();
  auto r = qpipe::WriteAllConcurrently(target, 4, std::move(source), true).get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 20);
  REQUIRE(produced.load() == 20);
  REQUIRE(target->Size() == 20U);
}

// ============================================================================
// Early results
// ============================================================================

TEST_CASE("write_concurrently - invalid arguments resolve immediately",
          "[write_concurrently]") {
  const auto values = Iota(3);
  std::atomic<int> pulls{0};

  SECTION("null target") {
    auto r = qpipe::WriteAllConcurrently<int>(nullptr, 2,
                                              CountedSource(values, &pulls))
                 .get();
    REQUIRE(r.get_error().code == qpipe::ErrorCode::kInvalidArgument);
  }
  SECTION("empty source") {
    auto target = qpipe::Channel<int>::Create();
    auto r = qpipe::WriteAllConcurrently(target, 2, qpipe::ItemSource<int>())
                 .get();
    REQUIRE(r.get_error().code == qpipe::ErrorCode::kInvalidArgument);
  }
  SECTION("zero concurrency") {
    auto target = qpipe::Channel<int>::Create();
    auto r = qpipe::WriteAllConcurrently(target, 0,
                                         CountedSource(values, &pulls), true)
                 .get();
    REQUIRE(r.get_error().code == qpipe::ErrorCode::kInvalidArgument);
    REQUIRE(target->IsWritable());
  }
  SECTION("negative concurrency") {
    auto target = qpipe::Channel<int>::Create();
    auto r = qpipe::WriteAllConcurrently(target, -1,
                                         CountedSource(values, &pulls))
                 .get();
    REQUIRE(r.get_error().code == qpipe::ErrorCode::kInvalidArgument);
  }
  REQUIRE(pulls.load() == 0);
}

TEST_CASE("write_concurrently - pre-canceled token touches nothing",
          "[write_concurrently]") {
  const auto values = Iota(10);
  std::atomic<int> pulls{0};
  qpipe::CancelSource cancel;
  cancel.Cancel();

  for (int k : {1, 4}) {
    auto target = qpipe::Channel<int>::Create();
    auto r = qpipe::WriteAllConcurrently(target, k,
                                         CountedSource(values, &pulls), true,
                                         cancel.Token())
                 .get();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error().IsCanceled());
    REQUIRE(target->Size() == 0U);
    REQUIRE_FALSE(target->IsCompleted());
  }
  REQUIRE(pulls.load() == 0);
}

TEST_CASE("write_concurrently - completed target fails with target closed",
          "[write_concurrently]") {
  const auto values = Iota(10);
  std::atomic<int> pulls{0};

  for (int k : {1, 4}) {
    auto target = qpipe::Channel<int>::Create();
    target->Complete();
    auto r = qpipe::WriteAllConcurrently(target, k,
                                         CountedSource(values, &pulls), true)
                 .get();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error().code == qpipe::ErrorCode::kTargetClosed);
  }
  REQUIRE(pulls.load() == 0);
}

// ============================================================================
// Faults and cancellation
// ============================================================================

TEST_CASE("write_concurrently - fault on third item stops the pool",
          "[write_concurrently]") {
  constexpr int kItems = 10;
  constexpr int kWorkers = 4;
  std::atomic<int> started{0};
  std::vector<std::function<int()>> producers;
  for (int i = 1; i <= kItems; ++i) {
    producers.emplace_back([i, &started] {
      started.fetch_add(1);
      if (i == 3) {
        throw std::runtime_error("item 3");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      return i;
    });
  }
  std::atomic<int> pulls{0};
  auto inner = qpipe::MakeDeferredSource(producers.begin(), producers.end());
  qpipe::ItemSource<int> source = [inner, &pulls](std::future<int>* out) mutable {
    pulls.fetch_add(1);
    return inner(out);
  };

  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(target, kWorkers, std::move(source),
                                       true)
               .get();

  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().code == qpipe::ErrorCode::kFaulted);
  REQUIRE_THROWS_AS(r.get_error().Rethrow(), std::runtime_error);

  // Target carries the same fault.
  REQUIRE(target->IsCompleted());
  REQUIRE(qpipe::SameFault(target->CompletionFault(), r.get_error()));

  // Items in flight when the fault hit may land; nothing new is taken on.
  auto got = DrainAll(*target);
  REQUIRE(got.size() < static_cast<size_t>(kItems));
  for (int v : got) {
    REQUIRE(v != 3);
  }
  REQUIRE(pulls.load() <= 3 + kWorkers);
  REQUIRE(started.load() < kItems);
}

TEST_CASE("write_concurrently - sequential fault completes target",
          "[write_concurrently]") {
  std::vector<std::function<int()>> producers;
  producers.emplace_back([] { return 1; });
  producers.emplace_back([]() -> int { throw std::logic_error("bad"); });
  producers.emplace_back([] { return 3; });

  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAll(
               target,
               qpipe::MakeDeferredSource(producers.begin(), producers.end()),
               true)
               .get();
  REQUIRE(r.get_error().code == qpipe::ErrorCode::kFaulted);
  REQUIRE_THROWS_AS(r.get_error().Rethrow(), std::logic_error);
  REQUIRE(DrainAll(*target) == std::vector<int>{1});
  REQUIRE(qpipe::SameFault(target->CompletionFault(), r.get_error()));
}

TEST_CASE("write_concurrently - throwing source faults the operation",
          "[write_concurrently]") {
  int pulled = 0;
  qpipe::ItemSource<int> source = [&pulled](std::future<int>* out) {
    if (pulled == 5) {
      throw std::runtime_error("enumeration failed");
    }
    std::promise<int> p;
    p.set_value(pulled++);
    *out = p.get_future();
    return true;
  };
  auto target = qpipe::Channel<int>::Create();
  auto r = qpipe::WriteAllConcurrently(target, 3, std::move(source)).get();
  REQUIRE(r.get_error().code == qpipe::ErrorCode::kFaulted);
  REQUIRE(target->Size() == 5U);
  REQUIRE(target->IsWritable());
}

TEST_CASE("write_concurrently - cancel while blocked on a full target",
          "[write_concurrently]") {
  const auto values = Iota(100);
  auto target = qpipe::Channel<int>::Create(2U);
  qpipe::CancelSource cancel;

  auto done = qpipe::WriteAllConcurrently(
      target, 3, qpipe::MakeValueSource(values.begin(), values.end()), true,
      cancel.Token());
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(done.wait_for(std::chrono::seconds(0)) !=
          std::future_status::ready);

  cancel.Cancel();
  auto r = done.get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().IsCanceled());
  // Cancellation is the caller's outcome; the target completes cleanly.
  REQUIRE(target->IsCompleted());
  REQUIRE(target->CompletionFault().code == qpipe::ErrorCode::kNone);
  REQUIRE(target->Size() == 2U);
  REQUIRE(DrainAll(*target).size() == 2U);
  REQUIRE(target->Read().get_error().IsClosed());
}

TEST_CASE("write_concurrently - sequential cancel completes target cleanly",
          "[write_concurrently]") {
  const auto values = Iota(50);
  auto target = qpipe::Channel<int>::Create(1U);
  qpipe::CancelSource cancel;

  auto done = qpipe::WriteAll(
      target, qpipe::MakeValueSource(values.begin(), values.end()), true,
      cancel.Token());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  cancel.Cancel();
  auto r = done.get();
  REQUIRE(r.get_error().IsCanceled());
  REQUIRE(target->IsCompleted());
  REQUIRE(target->CompletionFault().code == qpipe::ErrorCode::kNone);
  REQUIRE(target->Size() == 1U);
}
