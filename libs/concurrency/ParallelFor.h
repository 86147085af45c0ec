#pragma once

#include <cstddef>    // for std::size_t
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min, std::max

namespace concurrency {

  // Split [0…total) into at most exec.concurrencyLevel() chunks (or
  // maxChunks when given), submit each chunk to exec.submit, waitAll, and
  // internally loop p from chunk.start to chunk.end calling body(p).
  // The first exception thrown by body is rethrown after every chunk finished.
  template<typename Executor, typename Body>
  void parallel_for(std::size_t total, Executor& exec, Body body, std::size_t maxChunks = 0) {
    if (total == 0) return;

    const std::size_t numTasks = std::max<std::size_t>(1, maxChunks > 0 ? maxChunks : exec.concurrencyLevel());
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(
			     exec.submit([=]() {
				 for (std::size_t p = start; p < end; ++p) {
				   body(p);
				 }
			       })
			     );
      }
    exec.waitAll(futures);
  }

  template<typename Executor, typename Container, typename Body>
  void parallel_for_each(Executor& exec, const Container& container, Body body) {
    parallel_for(container.size(), exec,
		 [&container, &body](std::size_t p) { body(container[p]); });
  }
}
