#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <cstddef>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used by the stacking engine, grid predictor and
 * calibration aggregator.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Used by
 *    the unit tests and whenever a run must be reproduced step by step.
 *  - ThreadPoolExecutor: a fixed-size pool of worker threads. The pool size
 *    is either a template constant or chosen at construction time (the CLI
 *    passes the --threads / ncpu value).
 */
namespace concurrency
{
  // Number of workers to use when nothing is configured: the "ncpu"
  // environment variable if set, else hardware_concurrency (2 if unknown).
  std::size_t getNCpus();

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
   * Template parameter N fixes the number of workers. With N == 0 the
   * number comes from the constructor argument, and a zero argument falls
   * back to getNCpus().
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t requestedThreads = 0)
      : stop_(false)
    {
      std::size_t threads = N;
      if (threads == 0)
	threads = requestedThreads > 0 ? requestedThreads : getNCpus();
      if (threads == 0)
	threads = 2;

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

    std::size_t getNumThreads() const
    {
      return workers_.size();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty())
	    return;
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
      for (auto& w : workers_)
	if (w.joinable())
	  w.join();
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
