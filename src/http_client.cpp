/**
 * @file http_client.cpp
 * @brief libcurl transport used by the GitHub GraphQL client.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  if (!line.empty()) {
    static_cast<std::vector<std::string> *>(userdata)->push_back(line);
  }
  return total;
}

std::string format_curl_error(const std::string &url, CURLcode code,
                              const char *errbuf) {
  std::ostringstream oss;
  oss << "curl POST " << url << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  const std::string prefix = lower(name) + ":";
  for (const auto &h : headers) {
    if (lower(h.substr(0, prefix.size())) == prefix) {
      std::string value = h.substr(prefix.size());
      auto first = value.find_first_not_of(" \t");
      auto last = value.find_last_not_of(" \t");
      if (first == std::string::npos)
        return std::string();
      return value.substr(first, last - first + 1);
    }
  }
  return std::nullopt;
}

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy, std::string user_agent)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)), user_agent_(std::move(user_agent)) {}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    proxy = !https_proxy_.empty() ? &https_proxy_
            : !http_proxy_.empty() ? &http_proxy_
                                   : nullptr;
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &body,
                                  const std::vector<std::string> &headers) {
  CurlHandle handle;
  CURL *curl = handle.get();
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  header_list.append("Content-Type: application/json");
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  http_log()->trace("POST {} ({} bytes)", url, body.size());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(url, res, errbuf);
    http_log()->warn(msg);
    throw TransientNetworkError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  if (response.status_code < 200 || response.status_code >= 300) {
    if (response.status_code == 403 || response.status_code == 429) {
      return response;
    }
    http_log()->warn("POST {} failed with HTTP code {}", url,
                     response.status_code);
    throw HttpStatusError(static_cast<int>(response.status_code),
                          "POST " + url + " failed with HTTP code " +
                              std::to_string(response.status_code));
  }
  return response;
}

} // namespace ghd
