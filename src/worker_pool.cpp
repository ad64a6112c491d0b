#include "worker_pool.hpp"
#include "log.hpp"

#include <algorithm>
#include <memory>
#include <spdlog/spdlog.h>

namespace ghd {

namespace {
std::shared_ptr<spdlog::logger> pool_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pool");
  }();
  return logger;
}
} // namespace

/**
 * Construct a worker pool with optional rate limiting.
 *
 * @param workers Number of worker threads requested.
 * @param max_rate Maximum allowed task starts per minute (0 = unlimited).
 */
WorkerPool::WorkerPool(int workers, int max_rate)
    : workers_(std::max(1, workers)), max_rate_(std::max(0, max_rate)) {
  if (max_rate_ > 0) {
    auto interval =
        std::chrono::duration<double>(60.0 / static_cast<double>(max_rate_));
    min_interval_ =
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            interval);
    if (min_interval_.count() <= 0) {
      min_interval_ = std::chrono::nanoseconds(1);
    }
  }
  next_allowed_ = std::chrono::steady_clock::now();
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (running_)
    return;
  running_ = true;
  next_allowed_ = std::chrono::steady_clock::now();
  threads_.reserve(static_cast<std::size_t>(workers_));
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
  pool_log()->debug("Started {} workers (max rate {}/min)", workers_,
                    max_rate_);
}

void WorkerPool::stop() {
  if (!running_)
    return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = jobs_.size();
    std::queue<Job>().swap(jobs_);
    queued_.store(0, std::memory_order_relaxed);
  }
  if (dropped > 0) {
    pool_log()->warn("Worker pool stopped with {} queued task(s) abandoned",
                     dropped);
  }
}

std::future<void> WorkerPool::submit(std::string name,
                                     std::function<void()> job) {
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
  std::future<void> fut = task->get_future();
  if (!running_) {
    pool_log()->trace("Running {} inline", name);
    (*task)();
    return fut;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(Job{std::move(name), [task]() { (*task)(); }});
    queued_.fetch_add(1, std::memory_order_relaxed);
  }
  cv_.notify_one();
  return fut;
}

/**
 * Enforce the configured rate limit before executing a job.
 *
 * @return `true` if execution may proceed, `false` when the pool is stopping.
 */
bool WorkerPool::acquire_token() {
  if (max_rate_ <= 0)
    return running_;
  std::unique_lock<std::mutex> lock(rate_mutex_);
  while (running_) {
    auto now = std::chrono::steady_clock::now();
    if (now >= next_allowed_) {
      next_allowed_ = std::max(next_allowed_ + min_interval_, now);
      return true;
    }
    lock.unlock();
    auto wait = next_allowed_ - now;
    if (wait > std::chrono::milliseconds(50)) {
      wait = std::chrono::milliseconds(50);
    }
    std::this_thread::sleep_for(wait);
    lock.lock();
  }
  return false;
}

void WorkerPool::worker() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_)
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1, std::memory_order_relaxed);
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!acquire_token()) {
      in_flight_.fetch_sub(1, std::memory_order_relaxed);
      return;
    }
    pool_log()->trace("Running {}", job.name);
    job.run();
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
  }
}

} // namespace ghd
