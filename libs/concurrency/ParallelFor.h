#pragma once

#include <cstddef>    // for std::size_t
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min
#include <stdexcept>

namespace concurrency {

  // Number of chunks parallel_for_chunks will produce for a given total.
  inline std::size_t num_chunks(std::size_t total, std::size_t chunkSize)
  {
    if (chunkSize == 0)
      throw std::invalid_argument("num_chunks: chunk size must be positive");
    return (total + chunkSize - 1) / chunkSize;
  }

  // Split [0…total) into fixed-size chunks, submit each chunk to
  // exec.submit and block until all of them are done. body receives
  // (chunkIndex, begin, end). Chunk boundaries depend only on total and
  // chunkSize, never on the thread count, so per-chunk partial results
  // merged in chunk order are reproducible.
  template<typename Executor, typename Body>
  void parallel_for_chunks(std::size_t total, std::size_t chunkSize, Executor& exec, Body body)
  {
    if (total == 0)
      return;

    const std::size_t chunks = num_chunks(total, chunkSize);
    std::vector<std::future<void>> futures;
    futures.reserve(chunks);

    for (std::size_t c = 0; c < chunks; ++c)
      {
	const std::size_t start = c * chunkSize;
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() { body(c, start, end); }));
      }
    exec.waitAll(futures);
  }

  // Split [0…total) into at most T chunks (T = hardware_concurrency) and
  // call body(p) for every p.
  template<typename Executor, typename Body>
  void parallel_for(std::size_t total, Executor& exec, Body body)
  {
    if (total == 0)
      return;

    const unsigned hw = std::thread::hardware_concurrency();
    const std::size_t numTasks = hw ? hw : 2;
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks;

    parallel_for_chunks(total, chunkSize, exec,
			[=](std::size_t, std::size_t start, std::size_t end) {
			  for (std::size_t p = start; p < end; ++p)
			    body(p);
			});
  }
}
