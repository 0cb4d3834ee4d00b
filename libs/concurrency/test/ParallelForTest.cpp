#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace methcomp::concurrency;

TEST_CASE("makeIndexRanges partitions [0, total)", "[ParallelFor][ranges]")
{
  SECTION("Zero total gives no ranges")
  {
    REQUIRE(makeIndexRanges(0, 4).empty());
  }

  SECTION("Uneven split keeps the remainder in the last range")
  {
    const auto ranges = makeIndexRanges(10, 4);
    REQUIRE(ranges.size() == 3);
    REQUIRE(ranges[0].start == 0);
    REQUIRE(ranges[0].end == 4);
    REQUIRE(ranges[2].start == 8);
    REQUIRE(ranges[2].end == 10);
  }

  SECTION("Chunk larger than total")
  {
    const auto ranges = makeIndexRanges(3, 100);
    REQUIRE(ranges.size() == 1);
    REQUIRE(ranges[0].end == 3);
  }

  SECTION("Automatic chunk size covers every index contiguously")
  {
    const auto ranges = makeIndexRanges(1001, 0);
    REQUIRE_FALSE(ranges.empty());
    uint32_t expectedStart = 0;
    for (const auto& r : ranges)
    {
      REQUIRE(r.start == expectedStart);
      REQUIRE(r.end > r.start);
      expectedStart = r.end;
    }
    REQUIRE(expectedStart == 1001);
  }

  SECTION("defaultChunkSize is never zero")
  {
    REQUIRE(defaultChunkSize(0) >= 1);
    REQUIRE(defaultChunkSize(1) == 1);
  }
}

TEST_CASE("parallel_for basic operations", "[parallel_for]")
{
  SECTION("All indices are visited exactly once with a thread pool")
  {
    ThreadPoolExecutor<4> pool;
    std::vector<std::atomic<int>> visits(500);
    for (auto& v : visits)
      v.store(0);

    parallel_for(500, pool, [&visits](uint32_t i) { visits[i].fetch_add(1); });

    for (auto& v : visits)
      REQUIRE(v.load() == 1);
  }

  SECTION("Zero iterations never calls the body")
  {
    SingleThreadExecutor exec;
    bool called = false;
    parallel_for(0, exec, [&called](uint32_t) { called = true; });
    REQUIRE_FALSE(called);
  }

  SECTION("Single-thread execution is in index order")
  {
    SingleThreadExecutor exec;
    std::vector<uint32_t> order;
    parallel_for(7, exec, [&order](uint32_t i) { order.push_back(i); });
    REQUIRE(order == std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6});
  }
}

TEST_CASE("parallel_for_chunked basic operations", "[parallel_for_chunked]")
{
  SECTION("Per-index writes match the serial result")
  {
    std::vector<double> serial(257);
    std::vector<double> pooled(257);

    SingleThreadExecutor single;
    parallel_for_chunked(257, single, [&serial](uint32_t i) { serial[i] = 0.5 * i * i; }, 16);

    ThreadPoolExecutor<3> pool;
    parallel_for_chunked(257, pool, [&pooled](uint32_t i) { pooled[i] = 0.5 * i * i; }, 5);

    REQUIRE(serial == pooled);
  }

  SECTION("Chunk size of 1 with std::async")
  {
    StdAsyncExecutor exec;
    std::atomic<long> sum{0};
    parallel_for_chunked(40, exec, [&sum](uint32_t i) { sum.fetch_add(i); }, 1);
    REQUIRE(sum.load() == 780);
  }

  SECTION("A throwing body surfaces after all chunks finish")
  {
    ThreadPoolExecutor<2> pool;
    std::atomic<int> visited{0};
    REQUIRE_THROWS_AS(parallel_for_chunked(100, pool, [&visited](uint32_t i) {
                        visited.fetch_add(1);
                        if (i == 3)
                          throw std::runtime_error("body failed");
                      }, 10),
                      std::runtime_error);
    // Only the failing chunk stops early.
    REQUIRE(visited.load() == 94);
  }
}
