/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction and its libcurl implementation.
 */
#ifndef GHDIGEST_HTTP_CLIENT_HPP
#define GHDIGEST_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <optional>
#include <string>
#include <vector>

namespace ghd {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code

  /**
   * Look up a header value by name (case-insensitive).
   *
   * @return Trimmed value of the first matching header.
   */
  std::optional<std::string> header(const std::string &name) const;
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP POST request.
   *
   * @param url Absolute request URL.
   * @param body Request payload encoded as UTF-8.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body, headers and status. Responses with status 403 or
   *         429 are returned so callers can inspect rate limit headers.
   * @throws TransientNetworkError On connection failures and timeouts.
   * @throws HttpStatusError For other non-2xx responses.
   */
  virtual HttpResponse post(const std::string &url, const std::string &body,
                            const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Each request uses its own easy handle, so one instance may be shared by
 * several worker threads.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Request timeout in milliseconds.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   * @param user_agent Value of the User-Agent header.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {},
                          std::string user_agent = "ghdigest");

  /// @copydoc HttpClient::post()
  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers) override;

  long timeout_ms() const { return timeout_ms_; }
  const std::string &http_proxy() const { return http_proxy_; }
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url) const;

  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string user_agent_;
};

} // namespace ghd

#endif // GHDIGEST_HTTP_CLIENT_HPP
