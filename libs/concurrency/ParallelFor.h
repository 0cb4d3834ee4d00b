// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace methcomp
{
  namespace concurrency
  {
    // Half-open index range [start, end) handed to one submitted task.
    struct IndexRange
    {
      uint32_t start;
      uint32_t end;
    };

    // Chunk size that gives roughly one chunk per hardware thread.
    inline uint32_t defaultChunkSize(uint32_t total)
    {
      const unsigned hw = std::thread::hardware_concurrency();
      const uint32_t numTasks = hw ? hw : 2;
      return std::max<uint32_t>(1, (total + numTasks - 1) / numTasks);
    }

    // Split [0, total) into consecutive ranges of at most chunkSize indices.
    inline std::vector<IndexRange> makeIndexRanges(uint32_t total, uint32_t chunkSize)
    {
      std::vector<IndexRange> ranges;
      if (total == 0)
        return ranges;

      if (chunkSize == 0)
        chunkSize = defaultChunkSize(total);

      ranges.reserve((total + chunkSize - 1) / chunkSize);
      for (uint32_t start = 0; start < total; start += chunkSize)
        ranges.push_back(IndexRange{start, std::min(total, start + chunkSize)});

      return ranges;
    }

    // Split [0...total) into chunks of chunkSizeHint indices (0 = one chunk per
    // hardware thread), submit each chunk to exec, wait for all of them, and
    // call body(i) for every index of the chunk inside the task.
    template <typename Executor, typename Body>
    void parallel_for_chunked(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint = 0)
    {
      if (total == 0)
        return;

      const auto ranges = makeIndexRanges(total, chunkSizeHint);

      std::vector<std::future<void>> futures;
      futures.reserve(ranges.size());
      for (const auto& range : ranges)
        {
          futures.emplace_back(exec.submit([range, &body]() {
            for (uint32_t i = range.start; i < range.end; ++i)
              body(i);
          }));
        }

      exec.waitAll(futures);
    }

    template <typename Executor, typename Body>
    void parallel_for(uint32_t total, Executor& exec, Body body)
    {
      parallel_for_chunked(total, exec, body, 0);
    }
  } // namespace concurrency
} // namespace methcomp
