/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by ghdigest components.
 *
 * Configuration problems, network failures, state corruption and delivery
 * failures each map to a distinct exception type so the application entry
 * point can decide whether a run aborts, degrades, or exits with a usage
 * error.
 */
#ifndef GHDIGEST_ERRORS_HPP
#define GHDIGEST_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace ghd {

/// Invalid or incomplete configuration detected before any network call.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Connection, DNS, or timeout failure reported by the HTTP transport.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-successful HTTP status returned by the server.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code
};

/// HTTP 403/429 response carrying rate limit information.
class RateLimitError : public HttpStatusError {
public:
  RateLimitError(int status_code, std::chrono::seconds wait,
                 const std::string &message)
      : HttpStatusError(status_code, message), retry_after(wait) {}

  std::chrono::seconds retry_after; ///< Server-suggested wait (0 = unknown)
};

/**
 * Retries for a fetch were exhausted on a transient failure. The affected
 * repository/activity pair is skipped for the current run.
 */
class TransientFetchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Authentication failure, malformed query, or client error; aborts the run.
class FatalFetchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Requested repository owner or repository does not exist.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The persisted state file exists but cannot be read or parsed.
class StateCorruptionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The notifier failed to deliver the report.
class DeliveryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace ghd

#endif // GHDIGEST_ERRORS_HPP
