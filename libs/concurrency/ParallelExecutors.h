// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to spread independent work items over threads.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers (N == 0 picks the
 *    hardware concurrency).
 *
 * Every analyzer in this library produces bit-identical results under all
 * three policies; the policy only decides where the work runs.
 */
namespace methcomp
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     *
     * Default policy for all analyzers. Exceptions thrown by the task are
     * captured in the returned future, same as the threaded policies.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
        std::promise<void> prom;
        auto fut = prom.get_future();
        try
          {
            task();
            prom.set_value();
          }
        catch (...)
          {
            prom.set_exception(std::current_exception());
          }
        return fut;
      }
    };

    /**
     * @brief Spawns every task with std::async(std::launch::async).
     *
     * Suitable for a handful of coarse partitions; there is no bound on the
     * number of concurrently running tasks.
     */
    class StdAsyncExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
        return std::async(std::launch::async, std::move(task));
      }
    };

    /**
     * @brief Fixed-size thread pool.
     *
     * If N == 0 the pool size is std::thread::hardware_concurrency(),
     * falling back to 2 when that is unknown.
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor()
        : mStop(false)
      {
        const std::size_t threads = numberOfWorkers();

        try
          {
            for (std::size_t i = 0; i < threads; ++i)
              mWorkers.emplace_back([this] { workerLoop(); });
          }
        catch (...)
          {
            shutdown();
            throw;
          }
      }

      ~ThreadPoolExecutor()
      {
        shutdown();
      }

      std::future<void> submit(std::function<void()> task) override
      {
        auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
        auto fut = packaged->get_future();
        {
          std::lock_guard<std::mutex> lock(mTasksMutex);
          if (mStop)
            throw std::runtime_error("ThreadPoolExecutor::submit - pool is stopped");

          mTasks.emplace([packaged]() { (*packaged)(); });
        }
        mCondition.notify_one();
        return fut;
      }

      std::size_t getNumberOfWorkers() const
      {
        return mWorkers.size();
      }

    private:
      static std::size_t numberOfWorkers()
      {
        if (N > 0)
          return N;

        const unsigned hw = std::thread::hardware_concurrency();
        return hw ? hw : 2;
      }

      void workerLoop()
      {
        for (;;)
          {
            std::function<void()> task;
            {
              std::unique_lock<std::mutex> lock(mTasksMutex);
              mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
              if (mStop && mTasks.empty())
                return;

              task = std::move(mTasks.front());
              mTasks.pop();
            }
            task();
          }
      }

      void shutdown()
      {
        {
          std::lock_guard<std::mutex> lock(mTasksMutex);
          mStop = true;
        }
        mCondition.notify_all();
        for (auto& worker : mWorkers)
          {
            if (worker.joinable())
              worker.join();
          }
      }

    private:
      std::vector<std::thread>          mWorkers;
      std::queue<std::function<void()>> mTasks;
      std::mutex                        mTasksMutex;
      std::condition_variable           mCondition;
      bool                              mStop;
    };
  } // namespace concurrency
} // namespace methcomp
