#ifndef GHDIGEST_CONFIG_HPP
#define GHDIGEST_CONFIG_HPP

#include "activity_policy.hpp"
#include "repo_set.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace ghd {

/// Default e-mail subject.
inline constexpr const char *kDefaultSubject =
    "[ghdigest] New activity on your GitHub repositories";

/// Default GraphQL endpoint.
inline constexpr const char *kDefaultApiUrl = "https://api.github.com/graphql";

/// Default delivery command.
inline constexpr const char *kDefaultSendmailCommand = "sendmail -t -i";

/**
 * Application configuration loaded from a TOML, YAML, or JSON file.
 *
 * Settings live under a top-level `ghdigest` table; a document without that
 * table is read as the settings table itself. Key names accept dashes or
 * underscores. Unknown keys are rejected.
 */
class Config {
public:
  /// Configuration with every default applied.
  Config();

  /// E-mail recipient, if configured.
  const std::optional<std::string> &recipient() const { return recipient_; }
  void set_recipient(const std::string &value) { recipient_ = value; }

  /// E-mail sender, if configured.
  const std::optional<std::string> &sender() const { return sender_; }
  void set_sender(const std::string &value) { sender_ = value; }

  /// E-mail subject line.
  const std::string &subject() const { return subject_; }
  void set_subject(const std::string &value) { subject_ = value; }

  /// Token given inline in the configuration.
  const std::string &auth_token() const { return auth_token_; }
  void set_auth_token(const std::string &token) { auth_token_ = token; }

  /// File holding the token (resolved against the config directory).
  const std::string &auth_token_file() const { return auth_token_file_; }
  void set_auth_token_file(const std::string &path) { auth_token_file_ = path; }

  /// Location of the persisted tracking state.
  const std::string &state_file() const { return state_file_; }
  void set_state_file(const std::string &path) { state_file_ = path; }

  /// GraphQL endpoint.
  const std::string &api_url() const { return api_url_; }
  void set_api_url(const std::string &url) { api_url_ = url; }

  /// Command receiving the composed message on stdin.
  const std::string &sendmail_command() const { return sendmail_command_; }
  void set_sendmail_command(const std::string &cmd) { sendmail_command_ = cmd; }

  /// Number of fetch worker threads.
  int workers() const { return workers_; }
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// Maximum requests per minute (0 = unlimited).
  int max_request_rate() const { return max_request_rate_; }
  void set_max_request_rate(int rate) {
    max_request_rate_ = rate < 0 ? 0 : rate;
  }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Retries after a failed request.
  int http_retries() const { return http_retries_; }
  void set_http_retries(int r) { http_retries_ = r < 0 ? 0 : r; }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Logging verbosity level name.
  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// spdlog pattern (empty keeps the default).
  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Optional log file.
  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Rotated log files kept.
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int n) { log_rotate_ = n < 0 ? 0 : n; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool c) { log_compress_ = c; }

  /// Per-category level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Activity policy layers.
  const PolicyConfig &policy() const { return policy_; }
  void set_policy(const PolicyConfig &policy) { policy_ = policy; }

  /// Repository selection.
  const RepoSelection &repos() const { return repos_; }
  void set_repos(const RepoSelection &repos) { repos_ = repos; }

  /**
   * Determine the GitHub token.
   *
   * Looks at `auth-token`, then `auth-token-file`, then the `GH_TOKEN` and
   * `GITHUB_TOKEN` environment variables.
   *
   * @throws ConfigError When no token is available.
   */
  std::string resolve_auth_token() const;

  /**
   * Build a configuration from a parsed document.
   *
   * @param j Document root.
   * @param base_dir Directory that relative paths are resolved against.
   * @throws ConfigError On unknown keys or invalid values.
   */
  static Config from_json(const nlohmann::json &j,
                          const std::string &base_dir = "");

  /**
   * Load configuration from a file. The format is chosen by extension
   * (`.toml`, `.yaml`/`.yml`, `.json`).
   *
   * @throws ConfigError When the file cannot be read or is invalid.
   */
  static Config from_file(const std::string &path);

  /// `$XDG_CONFIG_HOME/ghdigest/config.toml` (or `~/.config/...`).
  static std::string default_config_path();

  /// `$XDG_STATE_HOME/ghdigest/state.json` (or `~/.local/state/...`).
  static std::string default_state_path();

private:
  void load_json(const nlohmann::json &j, const std::string &base_dir);

  std::optional<std::string> recipient_;
  std::optional<std::string> sender_;
  std::string subject_{kDefaultSubject};
  std::string auth_token_;
  std::string auth_token_file_;
  std::string state_file_;
  std::string api_url_{kDefaultApiUrl};
  std::string sendmail_command_{kDefaultSendmailCommand};
  int workers_{4};
  int max_request_rate_{0};
  int http_timeout_{30};
  int http_retries_{5};
  std::string http_proxy_;
  std::string https_proxy_;
  std::string log_level_{"warn"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
  PolicyConfig policy_;
  RepoSelection repos_;
};

/**
 * Check that @p value is an e-mail address, either bare (`a@b.c`) or with a
 * display name (`Name <a@b.c>`).
 */
bool is_valid_address(const std::string &value);

} // namespace ghd

#endif // GHDIGEST_CONFIG_HPP
