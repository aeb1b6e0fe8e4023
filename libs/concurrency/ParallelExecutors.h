#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to fan out independent experiment work.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Deterministic;
 *    used by the unit tests and when a run must be reproducible step by step.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers (N == 0 picks the hardware
 *    concurrency). Used to evaluate the pairwise tests of an experiment and to
 *    aggregate large record sets in chunks.
 *
 * Both report task failures through the returned future; IParallelExecutor::waitAll
 * is the synchronization barrier between pipeline stages.
 */
namespace abvalidator
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor {
    public:
      std::future<void> submit(std::function<void()> task) override {
        std::promise<void> prom;
        auto fut = prom.get_future();
        try {
          task();
          prom.set_value();
        } catch (...) {
          prom.set_exception(std::current_exception());
        }
        return fut;
      }
    };

    /**
     * @brief Fixed-size thread pool executor.
     *
     * Tasks are queued and picked up by the workers in submission order.
     * The destructor drains the queue before joining the workers.
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor() : stop_(false)
      {
        const std::size_t threads =
          N > 0 ? N : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

        try {
          for (std::size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this] { workerLoop(); });
        }
        catch (...) {
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
          std::unique_lock<std::mutex> lock(tasksMutex_);
          if (stop_)
            throw std::runtime_error("ThreadPoolExecutor: submit on stopped pool");
          tasks_.emplace([packaged]() { (*packaged)(); });
        }
        condition_.notify_one();
        return fut;
      }

      std::size_t getNumThreads() const
      {
        return workers_.size();
      }

    private:
      void workerLoop()
      {
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(tasksMutex_);
            condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
          }
          task();
        }
      }

      void shutdown()
      {
        {
          std::lock_guard<std::mutex> lock(tasksMutex_);
          stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_)
          if (worker.joinable()) worker.join();
      }

    private:
      std::vector<std::thread>          workers_;
      std::queue<std::function<void()>> tasks_;
      std::mutex                        tasksMutex_;
      std::condition_variable           condition_;
      bool                              stop_;
    };
  }
}
