/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool with an optional request-rate limiter.
 *
 * Fetch tasks are queued FIFO and executed by a fixed number of worker
 * threads. When a maximum rate is configured a token bucket spaces task
 * starts evenly across each minute.
 */
#ifndef GHDIGEST_WORKER_POOL_HPP
#define GHDIGEST_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ghd {

/**
 * Thread pool executing submitted tasks across multiple workers while
 * enforcing a maximum request rate.
 */
class WorkerPool {
public:
  /**
   * Construct a pool.
   *
   * @param workers Number of worker threads (at least one is used).
   * @param max_rate Maximum task starts per minute (0 = unlimited).
   */
  WorkerPool(int workers, int max_rate);

  /// Stops the worker threads.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /// Stop the worker threads after the running tasks finish. Queued tasks
  /// that never started are abandoned and their futures report
  /// `std::future_error`.
  void stop();

  /**
   * Submit a task for execution.
   *
   * When the pool has not been started the task runs inline on the calling
   * thread.
   *
   * @param name Label used in log messages.
   * @param job Callable to execute.
   * @return Future that becomes ready once the task completes; exceptions
   *         thrown by @p job are stored in it.
   */
  std::future<void> submit(std::string name, std::function<void()> job);

  /// Number of worker threads.
  int workers() const { return workers_; }

  /// Configured maximum task starts per minute.
  int max_rate() const { return max_rate_; }

  /// Number of queued plus in-flight tasks.
  std::size_t outstanding_jobs() const {
    return queued_.load(std::memory_order_relaxed) +
           in_flight_.load(std::memory_order_relaxed);
  }

private:
  struct Job {
    std::string name;
    std::function<void()> run;
  };

  void worker();
  bool acquire_token();

  int workers_;
  int max_rate_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<Job> jobs_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::mutex rate_mutex_;
  std::chrono::steady_clock::duration min_interval_{};
  std::chrono::steady_clock::time_point next_allowed_{};
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace ghd

#endif // GHDIGEST_WORKER_POOL_HPP
