/**
 * @file test_shared_cursor.cpp
 * @brief Catch2 tests for qpipe::SharedCursor.
 */

#include "qpipe/shared_cursor.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

/// Counts 0..limit-1, recording how often the pull step is invoked.
struct CountingPull {
  int limit;
  int next = 0;
  int* invocations;

  bool operator()(int* out) {
    ++*invocations;
    if (next >= limit) {
      return false;
    }
    *out = next++;
    return true;
  }
};

}  // namespace

TEST_CASE("shared_cursor - yields items in production order",
          "[shared_cursor]") {
  int invocations = 0;
  qpipe::SharedCursor<int> cursor(CountingPull{3, 0, &invocations});
  int v = -1;
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE(v == 0);
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE(v == 1);
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE(v == 2);
  REQUIRE(cursor.Yielded() == 3U);
  REQUIRE_FALSE(cursor.IsExhausted());
}

TEST_CASE("shared_cursor - pull is never called after exhaustion",
          "[shared_cursor]") {
  int invocations = 0;
  qpipe::SharedCursor<int> cursor(CountingPull{1, 0, &invocations});
  int v = -1;
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE_FALSE(cursor.TryAdvance(&v));
  REQUIRE(cursor.IsExhausted());
  REQUIRE(invocations == 2);

  REQUIRE_FALSE(cursor.TryAdvance(&v));
  REQUIRE_FALSE(cursor.TryAdvance(&v));
  REQUIRE(invocations == 2);
}

TEST_CASE("shared_cursor - empty sequence", "[shared_cursor]") {
  int invocations = 0;
  qpipe::SharedCursor<int> cursor(CountingPull{0, 0, &invocations});
  int v = -1;
  REQUIRE_FALSE(cursor.TryAdvance(&v));
  REQUIRE(cursor.IsExhausted());
  REQUIRE(cursor.Yielded() == 0U);
}

TEST_CASE("shared_cursor - throwing pull propagates and releases the lock",
          "[shared_cursor]") {
  int calls = 0;
  qpipe::SharedCursor<int> cursor([&calls](int* out) {
    if (++calls == 2) {
      throw std::runtime_error("producer failed");
    }
    *out = calls;
    return calls < 4;
  });
  int v = 0;
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE_THROWS_AS(cursor.TryAdvance(&v), std::runtime_error);
  // Lock released: the next advance proceeds.
  REQUIRE(cursor.TryAdvance(&v));
  REQUIRE(v == 3);
  REQUIRE_FALSE(cursor.IsExhausted());
}

TEST_CASE("shared_cursor - concurrent callers each get distinct items",
          "[shared_cursor]") {
  constexpr int kItems = 5000;
  int invocations = 0;
  qpipe::SharedCursor<int> cursor(CountingPull{kItems, 0, &invocations});

  std::mutex mtx;
  std::set<int> seen;
  std::atomic<int> duplicates{0};
  std::vector<std::thread> workers;
  for (int w = 0; w < 8; ++w) {
    workers.emplace_back([&] {
      int v = 0;
      while (cursor.TryAdvance(&v)) {
        std::lock_guard<std::mutex> lk(mtx);
        if (!seen.insert(v).second) {
          duplicates.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }

  REQUIRE(duplicates.load() == 0);
  REQUIRE(seen.size() == static_cast<size_t>(kItems));
  REQUIRE(cursor.Yielded() == static_cast<uint64_t>(kItems));
  // One extra pull observed exhaustion; later callers never reached pull.
  REQUIRE(invocations == kItems + 1);
}
