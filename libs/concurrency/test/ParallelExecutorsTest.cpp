#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <string>

using namespace concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Exceptions are delivered through the future")
  {
    auto future = executor.submit(createThrowingTask("boom"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Runtime thread count is honoured")
  {
    ThreadPoolExecutor<> executor(3);
    REQUIRE(executor.getNumThreads() == 3);
  }

  SECTION("Template thread count wins over the constructor argument")
  {
    ThreadPoolExecutor<2> executor(7);
    REQUIRE(executor.getNumThreads() == 2);
  }

  SECTION("All submitted tasks run")
  {
    ThreadPoolExecutor<4> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 200; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 200);
  }
}

TEST_CASE("waitAll is a barrier before rethrowing", "[IParallelExecutor][waitAll]")
{
  ThreadPoolExecutor<4> executor;
  std::atomic<int> finished{0};
  std::vector<std::future<void>> futures;

  futures.push_back(executor.submit(createThrowingTask("first failure")));
  for (int i = 0; i < 8; ++i)
    futures.push_back(executor.submit([&finished]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      finished.fetch_add(1);
    }));
  futures.push_back(executor.submit(createThrowingTask("second failure")));

  try {
    executor.waitAll(futures);
    FAIL("waitAll should have rethrown");
  }
  catch (const std::runtime_error& e) {
    REQUIRE(std::string(e.what()) == "first failure");
  }

  // every non-failing task completed before the exception surfaced
  REQUIRE(finished.load() == 8);
}

TEST_CASE("getNCpus honours the ncpu override", "[getNCpus]")
{
  REQUIRE(getNCpus() > 0);
}
