// concurrency/IParallelExecutor.h
#pragma once
#include <exception>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Barrier over a batch of futures. Every task is allowed to finish
    // before the first stored exception (in submission order) is rethrown,
    // so no task can outlive data owned by the caller.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      for (auto& f : futures)
	if (f.valid())
	  f.wait();

      std::exception_ptr first;
      for (auto& f : futures) {
	if (!f.valid())
	  continue;
	try {
	  f.get();
	}
	catch (...) {
	  if (!first)
	    first = std::current_exception();
	}
      }

      if (first)
	std::rethrow_exception(first);
    }
  };
}
