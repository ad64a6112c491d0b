#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "token_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghd {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Canonical key spelling: dashes instead of underscores.
std::string canonical_key(std::string key) {
  std::replace(key.begin(), key.end(), '_', '-');
  return key;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars are mapped to booleans and numbers where they parse as such.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (!s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) ||
                       s[0] == '-' || s[0] == '+')) {
      std::size_t idx = 0;
      try {
        long long i = std::stoll(s, &idx, 10);
        if (idx == s.size())
          return i;
      } catch (const std::exception &) {
        config_log()->trace("'{}' is not an integer", s);
      }
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  }
  case YAML::NodeType::Map: {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  if (const auto *table = node.as_table()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  std::ostringstream oss;
  if (const auto *value = node.as_date())
    oss << value->get();
  else if (const auto *value = node.as_time())
    oss << value->get();
  else if (const auto *value = node.as_date_time())
    oss << value->get();
  else
    return nullptr;
  return oss.str();
}

/**
 * Pick the settings table from a document and merge the `logging` and
 * `network` sections into it.
 */
nlohmann::json settings_table(const nlohmann::json &doc) {
  if (!doc.is_object()) {
    throw ConfigError("Configuration document must be a table");
  }
  nlohmann::json settings = doc;
  auto it = doc.find("ghdigest");
  if (it != doc.end()) {
    if (!it->is_object()) {
      throw ConfigError("'ghdigest' must be a table");
    }
    settings = *it;
  }
  for (const char *section : {"logging", "network"}) {
    auto sec = settings.find(section);
    if (sec == settings.end()) {
      continue;
    }
    if (!sec->is_object()) {
      throw ConfigError(std::string("'") + section + "' must be a table");
    }
    nlohmann::json values = *sec;
    settings.erase(section);
    for (const auto &[key, value] : values.items()) {
      settings[key] = value;
    }
  }
  return settings;
}

std::string as_string(const nlohmann::json &v, const std::string &key) {
  if (!v.is_string()) {
    throw ConfigError("'" + key + "' must be a string");
  }
  return v.get<std::string>();
}

int as_int(const nlohmann::json &v, const std::string &key, int min) {
  if (!v.is_number_integer()) {
    throw ConfigError("'" + key + "' must be an integer");
  }
  auto value = v.get<long long>();
  if (value < min || value > 1000000) {
    throw ConfigError("'" + key + "' is out of range");
  }
  return static_cast<int>(value);
}

bool as_bool(const nlohmann::json &v, const std::string &key) {
  if (!v.is_boolean()) {
    throw ConfigError("'" + key + "' must be a boolean");
  }
  return v.get<bool>();
}

std::vector<std::string> as_string_list(const nlohmann::json &v,
                                        const std::string &key) {
  if (!v.is_array()) {
    throw ConfigError("'" + key + "' must be a list of strings");
  }
  std::vector<std::string> out;
  for (const auto &item : v) {
    out.push_back(as_string(item, key));
  }
  return out;
}

std::string resolve_path(const std::string &path, const std::string &base_dir) {
  if (path.empty() || base_dir.empty()) {
    return path;
  }
  fs::path p(path);
  if (p.is_absolute()) {
    return path;
  }
  return (fs::path(base_dir) / p).lexically_normal().string();
}

PolicyConfig parse_activity(const nlohmann::json &table) {
  if (!table.is_object()) {
    throw ConfigError("'activity' must be a table");
  }
  PolicyConfig policy;
  nlohmann::json global = nlohmann::json::object();
  for (const auto &[key, value] : table.items()) {
    if (key == "affiliated") {
      policy.affiliated = PolicyLayer::from_json(value, "activity.affiliated");
    } else if (key == "repo") {
      if (!value.is_object()) {
        throw ConfigError("'activity.repo' must be a table");
      }
      for (const auto &[pattern, entry_table] : value.items()) {
        RepoPolicyEntry entry;
        entry.pattern = RepoPattern::parse(pattern);
        std::optional<bool> include;
        entry.layer = PolicyLayer::from_json(
            entry_table, "activity.repo.\"" + pattern + "\"", &include);
        entry.include = include.value_or(true);
        policy.repos.push_back(std::move(entry));
      }
    } else {
      global[key] = value;
    }
  }
  policy.global = PolicyLayer::from_json(global, "activity");
  return policy;
}

RepoSelection parse_repos(const nlohmann::json &table) {
  if (!table.is_object()) {
    throw ConfigError("'repos' must be a table");
  }
  RepoSelection selection;
  for (const auto &[raw_key, value] : table.items()) {
    std::string key = canonical_key(raw_key);
    if (key == "affiliations") {
      selection.affiliations.clear();
      for (const auto &token : as_string_list(value, "repos.affiliations")) {
        Affiliation a = parse_affiliation(token);
        if (std::find(selection.affiliations.begin(),
                      selection.affiliations.end(),
                      a) == selection.affiliations.end()) {
          selection.affiliations.push_back(a);
        }
      }
    } else if (key == "include") {
      for (const auto &p : as_string_list(value, "repos.include")) {
        selection.include.push_back(RepoPattern::parse(p));
      }
    } else if (key == "exclude") {
      for (const auto &p : as_string_list(value, "repos.exclude")) {
        selection.exclude.push_back(RepoPattern::parse(p));
      }
    } else {
      throw ConfigError("Unknown key '" + raw_key + "' in repos");
    }
  }
  return selection;
}

std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string();
}

std::string xdg_dir(const char *var, const char *fallback) {
  std::string base = env_or_empty(var);
  if (base.empty()) {
    std::string home = env_or_empty("HOME");
    base = home.empty() ? std::string(".") : (fs::path(home) / fallback).string();
  }
  return base;
}

} // namespace

Config::Config() : state_file_(default_state_path()) {}

std::string Config::default_config_path() {
  return (fs::path(xdg_dir("XDG_CONFIG_HOME", ".config")) / "ghdigest" /
          "config.toml")
      .string();
}

std::string Config::default_state_path() {
  return (fs::path(xdg_dir("XDG_STATE_HOME", ".local/state")) / "ghdigest" /
          "state.json")
      .string();
}

bool is_valid_address(const std::string &value) {
  std::string addr = value;
  auto open = value.rfind('<');
  if (open != std::string::npos) {
    if (value.back() != '>') {
      return false;
    }
    addr = value.substr(open + 1, value.size() - open - 2);
  }
  if (value.find_first_of("\r\n") != std::string::npos) {
    return false;
  }
  auto at = addr.find('@');
  if (at == std::string::npos || at == 0 || at + 1 >= addr.size() ||
      addr.find('@', at + 1) != std::string::npos) {
    return false;
  }
  return std::none_of(addr.begin(), addr.end(), [](unsigned char c) {
    return std::isspace(c) || c == '<' || c == '>';
  });
}

void Config::load_json(const nlohmann::json &doc, const std::string &base_dir) {
  nlohmann::json cfg = settings_table(doc);
  for (const auto &[raw_key, value] : cfg.items()) {
    const std::string key = canonical_key(raw_key);
    if (key == "recipient" || key == "sender") {
      std::string addr = as_string(value, key);
      if (!is_valid_address(addr)) {
        throw ConfigError("'" + key + "' is not a valid e-mail address: " +
                          addr);
      }
      key == "recipient" ? set_recipient(addr) : set_sender(addr);
    } else if (key == "subject") {
      set_subject(as_string(value, key));
    } else if (key == "auth-token") {
      set_auth_token(as_string(value, key));
    } else if (key == "auth-token-file") {
      set_auth_token_file(resolve_path(as_string(value, key), base_dir));
    } else if (key == "state-file") {
      set_state_file(resolve_path(as_string(value, key), base_dir));
    } else if (key == "api-url") {
      set_api_url(as_string(value, key));
    } else if (key == "sendmail-command") {
      set_sendmail_command(as_string(value, key));
    } else if (key == "workers") {
      set_workers(as_int(value, key, 1));
    } else if (key == "max-request-rate") {
      set_max_request_rate(as_int(value, key, 0));
    } else if (key == "http-timeout") {
      set_http_timeout(as_int(value, key, 1));
    } else if (key == "http-retries") {
      set_http_retries(as_int(value, key, 0));
    } else if (key == "http-proxy") {
      set_http_proxy(as_string(value, key));
    } else if (key == "https-proxy") {
      set_https_proxy(as_string(value, key));
    } else if (key == "log-level") {
      std::string level = as_string(value, key);
      parse_log_level(level);
      set_log_level(level);
    } else if (key == "log-pattern") {
      set_log_pattern(as_string(value, key));
    } else if (key == "log-file") {
      set_log_file(resolve_path(as_string(value, key), base_dir));
    } else if (key == "log-rotate") {
      set_log_rotate(as_int(value, key, 0));
    } else if (key == "log-compress") {
      set_log_compress(as_bool(value, key));
    } else if (key == "log-categories") {
      if (!value.is_object()) {
        throw ConfigError("'log-categories' must be a table");
      }
      std::unordered_map<std::string, std::string> categories;
      for (const auto &[category, level] : value.items()) {
        std::string name = as_string(level, "log-categories." + category);
        parse_log_level(name);
        categories[category] = name;
      }
      set_log_categories(categories);
    } else if (key == "activity") {
      set_policy(parse_activity(value));
    } else if (key == "repos") {
      set_repos(parse_repos(value));
    } else {
      config_log()->error("Unknown configuration key '{}'", raw_key);
      throw ConfigError("Unknown configuration key '" + raw_key + "'");
    }
  }
}

std::string Config::resolve_auth_token() const {
  if (!auth_token_.empty()) {
    return auth_token_;
  }
  if (!auth_token_file_.empty()) {
    std::vector<std::string> tokens;
    try {
      tokens = load_tokens_from_file(auth_token_file_);
    } catch (const std::exception &e) {
      config_log()->error("Failed to read token file {}: {}", auth_token_file_,
                          e.what());
      throw ConfigError("Failed to read auth-token-file " + auth_token_file_ +
                        ": " + e.what());
    }
    if (tokens.empty()) {
      throw ConfigError("auth-token-file " + auth_token_file_ +
                        " contains no token");
    }
    return tokens.front();
  }
  for (const char *var : {"GH_TOKEN", "GITHUB_TOKEN"}) {
    std::string token = env_or_empty(var);
    if (!token.empty()) {
      config_log()->debug("Using GitHub token from {}", var);
      return token;
    }
  }
  throw ConfigError("GitHub token not set; set auth-token or auth-token-file "
                    "in the configuration, or GH_TOKEN/GITHUB_TOKEN in the "
                    "environment");
}

Config Config::from_json(const nlohmann::json &j, const std::string &base_dir) {
  Config cfg;
  cfg.load_json(j, base_dir);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  std::string ext = to_lower_copy(fs::path(path).extension().string());
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw ConfigError("Configuration file " + path + " does not exist");
  }
  nlohmann::json doc;
  try {
    if (ext == ".yaml" || ext == ".yml") {
      doc = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == ".json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("Failed to open config file " + path);
      }
      doc = nlohmann::json::parse(f);
    } else if (ext == ".toml" || ext == ".tml") {
      doc = toml_to_json(toml::parse_file(path));
    } else {
      throw ConfigError("Unsupported config format '" + ext + "' for " + path);
    }
  } catch (const ConfigError &) {
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to parse config {}: {}", path, e.what());
    throw ConfigError("Failed to parse " + path + ": " + e.what());
  }
  std::string base_dir = fs::absolute(fs::path(path), ec).parent_path().string();
  Config cfg = from_json(doc, base_dir);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace ghd
