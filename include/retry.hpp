/**
 * @file retry.hpp
 * @brief Bounded retry with exponential backoff.
 */
#ifndef GHDIGEST_RETRY_HPP
#define GHDIGEST_RETRY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <string>

namespace ghd {

/**
 * Determine whether an exception represents a transient failure: transport
 * errors, HTTP 5xx responses and rate limiting.
 */
bool is_retryable_error(const std::exception &e);

/**
 * Retry schedule wrapping a network operation.
 *
 * Attempt `i` (zero based) that fails with a retryable error sleeps
 * `min(base_backoff * 2^i, max_backoff)` before the next attempt. Rate limit
 * errors carrying a `Retry-After` wait that long instead, capped at
 * @ref max_backoff.
 */
struct RetryPolicy {
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using Predicate = std::function<bool(const std::exception &)>;

  int max_attempts{6};
  std::chrono::milliseconds base_backoff{1250};
  std::chrono::milliseconds max_backoff{120000};
  Predicate retryable{is_retryable_error};
  Sleeper sleep{default_sleep};

  /// Policy allowing @p retries retries after the first attempt.
  static RetryPolicy with_retries(int retries);

  /// Backoff before the attempt following failed attempt @p attempt.
  std::chrono::milliseconds backoff(int attempt) const;

  /// Delay to apply after @p e failed attempt @p attempt.
  std::chrono::milliseconds delay_for(const std::exception &e,
                                      int attempt) const;

  /**
   * Run @p op until it succeeds, fails with a non-retryable error or the
   * attempt bound is reached. The last error is rethrown.
   *
   * @param op Operation to run.
   * @param what Description used in log messages.
   */
  template <typename F> auto run(F &&op, const std::string &what) const
      -> decltype(op()) {
    int attempt = 0;
    while (true) {
      try {
        return op();
      } catch (const std::exception &e) {
        if (attempt + 1 >= max_attempts || !retryable(e)) {
          throw;
        }
        auto wait = delay_for(e, attempt);
        log_retry(what, e, attempt, wait);
        sleep(wait);
        ++attempt;
      }
    }
  }

  static void default_sleep(std::chrono::milliseconds wait);

private:
  void log_retry(const std::string &what, const std::exception &e, int attempt,
                 std::chrono::milliseconds wait) const;
};

} // namespace ghd

#endif // GHDIGEST_RETRY_HPP
