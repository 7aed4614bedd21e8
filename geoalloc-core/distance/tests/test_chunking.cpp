#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/chunking.hpp>
#include <geoalloc/distance/request_pool.hpp>
#include <geoalloc/distance/retry.hpp>
#include <stdexcept>
#include <thread>

using namespace geoalloc;
using namespace geoalloc::distance;

namespace {

  size_t covered_cells(const std::vector<TableChunk>& chunks) {
    size_t total = 0;
    for (const auto& c : chunks) total += c.sources() * c.destinations();
    return total;
  }

}  // namespace

// =============================================================================
// SECTION 1: Chunk Planning
// =============================================================================

TEST(ChunkPlanTest, SingleChunkWhenWithinLimits) {
  auto chunks = plan_chunks(10, 10, {100, 100, 10000});
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], (TableChunk{0, 10, 0, 10}));
}

TEST(ChunkPlanTest, PerAxisLimit) {
  auto chunks = plan_chunks(5, 5, {2, 2, 4});
  EXPECT_EQ(chunks.size(), 9u);
  EXPECT_EQ(covered_cells(chunks), 25u);
  for (const auto& c : chunks) {
    EXPECT_LE(c.sources(), 2u);
    EXPECT_LE(c.destinations(), 2u);
  }
}

TEST(ChunkPlanTest, ElementLimitShrinksBlocks) {
  auto chunks = plan_chunks(30, 30, {25, 25, 100});
  EXPECT_EQ(covered_cells(chunks), 900u);
  for (const auto& c : chunks) {
    EXPECT_LE(c.sources() * c.destinations(), 100u);
    EXPECT_LE(c.sources(), 25u);
  }
  EXPECT_EQ(chunks.size(), 9u);
}

TEST(ChunkPlanTest, NarrowTableUsesLongRows) {
  auto chunks = plan_chunks(3, 40, {25, 25, 100});
  EXPECT_EQ(covered_cells(chunks), 120u);
  for (const auto& c : chunks) EXPECT_LE(c.sources() * c.destinations(), 100u);
}

TEST(ChunkPlanTest, CellsCoveredExactlyOnce) {
  const size_t ns = 17, nd = 23;
  auto chunks = plan_chunks(ns, nd, {4, 5, 20});
  std::vector<int> hits(ns * nd, 0);
  for (const auto& c : chunks) {
    for (size_t i = c.src_begin; i < c.src_end; ++i) {
      for (size_t j = c.dst_begin; j < c.dst_end; ++j) hits[i * nd + j]++;
    }
  }
  for (int h : hits) EXPECT_EQ(h, 1);
}

TEST(ChunkPlanTest, EmptyAndInvalid) {
  EXPECT_TRUE(plan_chunks(0, 5, {2, 2, 4}).empty());
  EXPECT_THROW((void)plan_chunks(5, 5, {0, 2, 4}), ValidationError);
}

// =============================================================================
// SECTION 2: Bounded Pool
// =============================================================================

TEST(RequestPoolTest, RunsEveryTaskOnce) {
  std::vector<std::atomic<int>> seen(50);
  run_bounded(50, 4, [&](size_t i, const std::atomic<bool>&) { seen[i]++; });
  for (auto& s : seen) EXPECT_EQ(s.load(), 1);
}

TEST(RequestPoolTest, NeverExceedsInFlightBound) {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  run_bounded(40, 3, [&](size_t, const std::atomic<bool>&) {
    int now = ++in_flight;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    --in_flight;
  });
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(RequestPoolTest, FirstFailureCancelsRemainingTasks) {
  std::atomic<int> started{0};
  EXPECT_THROW(run_bounded(100, 1,
                           [&](size_t i, const std::atomic<bool>&) {
                             ++started;
                             if (i == 2) throw std::runtime_error("boom");
                           }),
               std::runtime_error);
  EXPECT_EQ(started.load(), 3);
}

TEST(RequestPoolTest, ZeroTasks) {
  EXPECT_NO_THROW(run_bounded(0, 4, [](size_t, const std::atomic<bool>&) {}));
}

// =============================================================================
// SECTION 3: Retry
// =============================================================================

TEST(RetryTest, BackoffGrowsAndCaps) {
  RetryPolicy policy{6, 100, 2.0, 500};
  EXPECT_EQ(backoff_delay(policy, 1).count(), 100);
  EXPECT_EQ(backoff_delay(policy, 2).count(), 200);
  EXPECT_EQ(backoff_delay(policy, 3).count(), 400);
  EXPECT_EQ(backoff_delay(policy, 4).count(), 500);
}

TEST(RetryTest, TransientErrorsRetriedUntilSuccess) {
  RetryPolicy policy{4, 0, 2.0, 0};
  std::atomic<bool> cancelled{false};
  int calls = 0;
  int value = with_retry(policy, cancelled, [&] {
    if (++calls < 3) throw ExternalServiceError("svc", "busy", 503, true);
    return 7;
  });
  EXPECT_EQ(value, 7);
  EXPECT_EQ(calls, 3);
}

TEST(RetryTest, PermanentErrorNotRetried) {
  RetryPolicy policy{4, 0, 2.0, 0};
  std::atomic<bool> cancelled{false};
  int calls = 0;
  EXPECT_THROW(with_retry(policy, cancelled,
                          [&]() -> int {
                            ++calls;
                            throw ExternalServiceError("svc", "denied", 401, false);
                          }),
               ExternalServiceError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryTest, AttemptsAreBounded) {
  RetryPolicy policy{3, 0, 2.0, 0};
  std::atomic<bool> cancelled{false};
  int calls = 0;
  try {
    (void)with_retry(policy, cancelled, [&]() -> int {
      ++calls;
      throw ExternalServiceError("svc", "rate limited", 429, true);
    });
    FAIL() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_TRUE(e.transient());
    EXPECT_EQ(e.http_status(), 429);
  }
  EXPECT_EQ(calls, 3);
}

TEST(RetryTest, CancellationDuringBackoffStopsRetrying) {
  RetryPolicy policy{4, 300, 2.0, 1000};
  std::atomic<bool> cancelled{false};
  int calls = 0;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancelled.store(true);
  });

  const auto started = std::chrono::steady_clock::now();
  try {
    (void)with_retry(policy, cancelled, [&]() -> int {
      ++calls;
      throw ExternalServiceError("svc", "rate limited", 429, true);
    });
    ADD_FAILURE() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_EQ(e.http_status(), 429);
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  EXPECT_EQ(calls, 1);
  EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST(RetryTest, PermanentFailureInPoolInterruptsSiblingBackoff) {
  RetryPolicy policy{4, 300, 2.0, 1000};
  std::atomic<int> retried_calls{0};

  const auto started = std::chrono::steady_clock::now();
  try {
    run_bounded(2, 2, [&](size_t index, const std::atomic<bool>& cancelled) {
      if (index == 0) {
        (void)with_retry(policy, cancelled, [&]() -> int {
          ++retried_calls;
          throw ExternalServiceError("svc", "rate limited", 429, true);
        });
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw ExternalServiceError("svc", "auth", 401, false);
      }
    });
    ADD_FAILURE() << "expected ExternalServiceError";
  } catch (const ExternalServiceError& e) {
    EXPECT_EQ(e.http_status(), 401);
    EXPECT_FALSE(e.transient());
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(retried_calls.load(), 1);
  EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}
