#include "worker_pool.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ghd;

TEST_CASE("worker pool runs jobs inline before start") {
  WorkerPool pool(2, 0);
  auto caller = std::this_thread::get_id();
  std::thread::id ran_on;
  auto fut = pool.submit("inline", [&ran_on] {
    ran_on = std::this_thread::get_id();
  });
  fut.get();
  CHECK(ran_on == caller);
}

TEST_CASE("worker pool executes jobs on worker threads") {
  WorkerPool pool(3, 0);
  pool.start();
  std::atomic<int> count{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 20; ++i) {
    futures.push_back(pool.submit("job", [&count] { ++count; }));
  }
  for (auto &f : futures) {
    f.get();
  }
  CHECK(count == 20);
  CHECK(pool.outstanding_jobs() == 0);
  pool.stop();
}

TEST_CASE("worker pool propagates job exceptions through futures") {
  WorkerPool pool(1, 0);
  pool.start();
  auto fut = pool.submit("boom", [] { throw std::runtime_error("boom"); });
  CHECK_THROWS_AS(fut.get(), std::runtime_error);
  pool.stop();
}

TEST_CASE("worker pool clamps its configuration") {
  WorkerPool pool(0, -5);
  CHECK(pool.workers() == 1);
  CHECK(pool.max_rate() == 0);
}

TEST_CASE("worker pool spaces job starts under a rate limit") {
  WorkerPool pool(2, 600); // one start every 100 ms
  pool.start();
  auto begin = std::chrono::steady_clock::now();
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 3; ++i) {
    futures.push_back(pool.submit("limited", [] {}));
  }
  for (auto &f : futures) {
    f.get();
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;
  CHECK(elapsed >= std::chrono::milliseconds(180));
  pool.stop();
}
