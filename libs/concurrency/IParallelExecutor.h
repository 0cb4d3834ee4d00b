// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace methcomp
{
  namespace concurrency
  {
    /**
     * @brief Interface implemented by every executor policy.
     *
     * Analyzers that partition work (pairwise slopes, bootstrap replicates)
     * are templated on a concrete executor, but all executors share this
     * contract so they can also be used through a base reference.
     */
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; the returned future re-throws any task exception.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Block until every future is ready, then re-throw the first task
      // exception. All tasks finish before this returns or throws, so task
      // bodies may safely reference the caller's stack.
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
        std::exception_ptr firstError;
        for (auto& f : futures)
          {
            try
              {
                f.get();
              }
            catch (...)
              {
                if (!firstError)
                  firstError = std::current_exception();
              }
          }

        if (firstError)
          std::rethrow_exception(firstError);
      }
    };
  } // namespace concurrency
} // namespace methcomp
