#pragma once

#include <algorithm>  // for std::min
#include <cstddef>
#include <future>     // for std::future
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>

namespace abvalidator
{
  namespace concurrency
  {
    inline std::size_t defaultChunkCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    // Split [0, total) into at most maxChunks contiguous chunks (0 means one per
    // hardware thread), submit body(start, end) for each chunk and wait for all
    // of them. Rethrows the first chunk failure after every chunk has finished.
    template<typename Executor, typename ChunkBody>
    void parallel_for_chunks(std::size_t total, Executor& exec, ChunkBody body,
                             std::size_t maxChunks = 0)
    {
      if (total == 0) return;

      const std::size_t numChunks = maxChunks ? maxChunks : defaultChunkCount();
      const std::size_t chunkSize = (total + numChunks - 1) / numChunks; // ceil-divide

      std::vector<std::future<void>> futures;
      futures.reserve((total + chunkSize - 1) / chunkSize);
      for (std::size_t start = 0; start < total; start += chunkSize)
        {
          const std::size_t end = std::min(total, start + chunkSize);
          futures.emplace_back(exec.submit([=]() { body(start, end); }));
        }
      exec.waitAll(futures);
    }

    // Calls body(i) for every i in [0, total), chunked across the executor.
    template<typename Executor, typename Body>
    void parallel_for(std::size_t total, Executor& exec, Body body)
    {
      parallel_for_chunks(total, exec,
                          [body](std::size_t start, std::size_t end) {
                            for (std::size_t i = start; i < end; ++i)
                              body(i);
                          });
    }
  }
}
