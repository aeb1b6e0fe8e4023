// concurrency/IParallelExecutor.h
#pragma once
#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace abvalidator
{
  namespace concurrency
  {
    class IParallelExecutor {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; returns a std::future you can wait on.
      virtual std::future<void> submit(std::function<void()> task) = 0;

      // Barrier: waits for every future before rethrowing the first failure,
      // so no task is still running against caller-owned state on return.
      virtual void waitAll(std::vector<std::future<void>>& futures) {
        for (auto& f : futures) f.wait();

        std::exception_ptr firstFailure;
        for (auto& f : futures) {
          try {
            f.get();
          }
          catch (...) {
            if (!firstFailure) firstFailure = std::current_exception();
          }
        }
        if (firstFailure) std::rethrow_exception(firstFailure);
      }
    };
  }
}
