#include "retry.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <memory>
#include <spdlog/spdlog.h>
#include <thread>

namespace ghd {

namespace {
std::shared_ptr<spdlog::logger> client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}
} // namespace

bool is_retryable_error(const std::exception &e) {
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return true;
  }
  if (dynamic_cast<const RateLimitError *>(&e)) {
    return true;
  }
  if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status >= 500 && http_err->status < 600;
  }
  return false;
}

RetryPolicy RetryPolicy::with_retries(int retries) {
  RetryPolicy policy;
  policy.max_attempts = 1 + std::max(0, retries);
  return policy;
}

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const {
  auto wait = base_backoff;
  for (int i = 0; i < attempt && wait < max_backoff; ++i) {
    wait *= 2;
  }
  return std::min(wait, max_backoff);
}

std::chrono::milliseconds RetryPolicy::delay_for(const std::exception &e,
                                                 int attempt) const {
  if (auto limited = dynamic_cast<const RateLimitError *>(&e)) {
    if (limited->retry_after.count() > 0) {
      return std::min<std::chrono::milliseconds>(limited->retry_after,
                                                 max_backoff);
    }
  }
  return backoff(attempt);
}

void RetryPolicy::default_sleep(std::chrono::milliseconds wait) {
  std::this_thread::sleep_for(wait);
}

void RetryPolicy::log_retry(const std::string &what, const std::exception &e,
                            int attempt, std::chrono::milliseconds wait) const {
  client_log()->warn("{} failed (attempt {}/{}): {}; retrying in {} ms", what,
                     attempt + 1, max_attempts, e.what(), wait.count());
}

} // namespace ghd
