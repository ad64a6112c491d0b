#include "errors.hpp"
#include "retry.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <vector>

using namespace ghd;
using namespace std::chrono;

namespace {
RetryPolicy recording_policy(std::vector<milliseconds> &waits, int retries) {
  RetryPolicy policy = RetryPolicy::with_retries(retries);
  policy.sleep = [&waits](milliseconds wait) { waits.push_back(wait); };
  return policy;
}
} // namespace

TEST_CASE("retryable error classification") {
  CHECK(is_retryable_error(TransientNetworkError("reset")));
  CHECK(is_retryable_error(RateLimitError(429, seconds(5), "slow down")));
  CHECK(is_retryable_error(HttpStatusError(502, "bad gateway")));
  CHECK_FALSE(is_retryable_error(HttpStatusError(404, "missing")));
  CHECK_FALSE(is_retryable_error(HttpStatusError(401, "unauthorized")));
  CHECK_FALSE(is_retryable_error(FatalFetchError("graphql")));
  CHECK_FALSE(is_retryable_error(std::runtime_error("other")));
}

TEST_CASE("backoff doubles up to the cap") {
  RetryPolicy policy;
  CHECK(policy.backoff(0) == milliseconds(1250));
  CHECK(policy.backoff(1) == milliseconds(2500));
  CHECK(policy.backoff(3) == milliseconds(10000));
  CHECK(policy.backoff(10) == milliseconds(120000));
  CHECK(policy.backoff(40) == milliseconds(120000));
}

TEST_CASE("rate limit errors wait for Retry-After") {
  RetryPolicy policy;
  CHECK(policy.delay_for(RateLimitError(403, seconds(7), "limited"), 0) ==
        milliseconds(7000));
  CHECK(policy.delay_for(RateLimitError(403, seconds(600), "limited"), 0) ==
        milliseconds(120000));
  CHECK(policy.delay_for(RateLimitError(429, seconds(0), "limited"), 2) ==
        milliseconds(5000));
}

TEST_CASE("run retries transient failures then succeeds") {
  std::vector<milliseconds> waits;
  auto policy = recording_policy(waits, 5);
  int calls = 0;
  int value = policy.run(
      [&calls]() {
        if (++calls < 3) {
          throw TransientNetworkError("timeout");
        }
        return 42;
      },
      "test");
  CHECK(value == 42);
  CHECK(calls == 3);
  CHECK(waits == std::vector<milliseconds>{milliseconds(1250),
                                           milliseconds(2500)});
}

TEST_CASE("run gives up after the attempt bound") {
  std::vector<milliseconds> waits;
  auto policy = recording_policy(waits, 2);
  int calls = 0;
  CHECK_THROWS_AS(policy.run(
                      [&calls]() -> int {
                        ++calls;
                        throw HttpStatusError(503, "unavailable");
                      },
                      "test"),
                  HttpStatusError);
  CHECK(calls == 3);
  CHECK(waits.size() == 2);
}

TEST_CASE("run does not retry permanent failures") {
  std::vector<milliseconds> waits;
  auto policy = recording_policy(waits, 5);
  int calls = 0;
  CHECK_THROWS_AS(policy.run(
                      [&calls]() -> int {
                        ++calls;
                        throw HttpStatusError(401, "bad credentials");
                      },
                      "test"),
                  HttpStatusError);
  CHECK(calls == 1);
  CHECK(waits.empty());
}

TEST_CASE("zero retries means a single attempt") {
  CHECK(RetryPolicy::with_retries(0).max_attempts == 1);
  CHECK(RetryPolicy::with_retries(-3).max_attempts == 1);
  CHECK(RetryPolicy::with_retries(5).max_attempts == 6);
}
