#include "app.hpp"
#include "errors.hpp"
#include "github_source.hpp"
#include "http_client.hpp"
#include "lockfile.hpp"
#include "log.hpp"
#include "report.hpp"
#include "retry.hpp"
#include "tracking_state.hpp"
#include "version.hpp"
#include "worker_pool.hpp"

#include <iostream>
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <utility>

namespace ghd {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::unique_ptr<ActivitySource> make_github_source(const Config &cfg) {
  auto http = std::make_unique<CurlHttpClient>(
      static_cast<long>(cfg.http_timeout()) * 1000, cfg.http_proxy(),
      cfg.https_proxy(), std::string("ghdigest/") + kVersionString);
  return std::make_unique<GitHubGraphQLClient>(
      cfg.resolve_auth_token(), std::move(http), cfg.api_url(),
      RetryPolicy::with_retries(cfg.http_retries()));
}

std::unique_ptr<Notifier> make_mail_notifier(const Config &cfg) {
  MailSettings settings{cfg.recipient(), cfg.sender(), cfg.subject()};
  return std::make_unique<MailNotifier>(std::move(settings),
                                        cfg.sendmail_command());
}
} // namespace

std::vector<PlannedRepository>
plan_repositories(const std::vector<TrackedRepository> &tracked,
                  const PolicyConfig &policies) {
  std::vector<PlannedRepository> planned;
  planned.reserve(tracked.size());
  for (const auto &t : tracked) {
    planned.push_back({t.repo, policy_for(t.repo, t.affiliated, policies)});
  }
  return planned;
}

nlohmann::json dump_repo_policies(const std::vector<PlannedRepository> &repos) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto &p : repos) {
    out[p.repo.full_name()] = policy_to_json(p.policy);
  }
  return out;
}

App::App()
    : source_factory_(make_github_source),
      notifier_factory_(make_mail_notifier), out_(&std::cout),
      clock_(current_time) {}

int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  try {
    return execute();
  } catch (const ConfigError &e) {
    app_log()->error("{}", e.what());
    return 2;
  } catch (const StateCorruptionError &e) {
    app_log()->error("State file is corrupt: {}", e.what());
    return 1;
  } catch (const FatalFetchError &e) {
    app_log()->error("Fetching activity failed: {}", e.what());
    return 1;
  } catch (const DeliveryError &e) {
    app_log()->error("Delivery failed: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

void App::load_config() {
  std::string path = options_.config_file.empty()
                         ? Config::default_config_path()
                         : options_.config_file;
  config_ = Config::from_file(path);
  if (options_.verbose) {
    config_.set_log_level("debug");
  } else if (options_.log_level) {
    parse_log_level(*options_.log_level);
    config_.set_log_level(*options_.log_level);
  }
  if (options_.log_file) {
    config_.set_log_file(*options_.log_file);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(categories);
  }
}

void App::configure_logging() const {
  LogOptions log_options;
  log_options.level = parse_log_level(config_.log_level());
  log_options.pattern = config_.log_pattern();
  log_options.file = config_.log_file();
  log_options.rotate = static_cast<std::size_t>(config_.log_rotate());
  log_options.compress = config_.log_compress();
  init_logger(log_options);
  std::unordered_map<std::string, spdlog::level::level_enum> overrides;
  for (const auto &[name, level] : config_.log_categories()) {
    overrides[name] = parse_log_level(level);
  }
  if (!overrides.empty()) {
    configure_log_categories(overrides);
  }
}

int App::execute() {
  load_config();
  configure_logging();
  // Activity is compared against the moment the run started.
  const Timestamp now = clock_();

  LockFile lock(LockFile::for_state_file(config_.state_file()));
  if (!lock.acquired()) {
    app_log()->error("{}", lock.error());
    return 1;
  }

  const RunMode mode = options_.mode;
  if ((mode == RunMode::Send || mode == RunMode::Print) &&
      !config_.recipient()) {
    throw ConfigError("recipient must be set when constructing an e-mail");
  }
  std::unique_ptr<Notifier> notifier;
  if (mode == RunMode::Send || mode == RunMode::Print) {
    notifier = notifier_factory_(config_);
  }

  TrackingState previous;
  if (mode != RunMode::DumpRepos) {
    previous = load_state(config_.state_file());
  }

  auto source = source_factory_(config_);
  auto tracked = resolve_repositories(*source, config_.repos(),
                                      config_.policy());
  auto planned = plan_repositories(tracked, config_.policy());
  if (mode == RunMode::DumpRepos) {
    *out_ << dump_repo_policies(planned).dump(4) << std::endl;
    return 0;
  }

  DiffResult result;
  {
    WorkerPool pool(config_.workers(), config_.max_request_rate());
    pool.start();
    DiffEngine engine(*source, &pool);
    result = engine.diff(planned, previous, now);
  }

  auto items = order_report(result.events, result.notices);
  if (!items.empty()) {
    switch (mode) {
    case RunMode::Print:
      *out_ << notifier->render(items) << std::endl;
      break;
    case RunMode::PrintBody:
      *out_ << render_report(items) << std::endl;
      break;
    default:
      app_log()->info("Sending e-mail ...");
      notifier->deliver(items);
      break;
    }
  } else {
    app_log()->info("No new activity");
  }

  if (options_.save) {
    save_state(config_.state_file(), result.next_state);
  } else {
    app_log()->debug("Not saving state (--no-save)");
  }
  return 0;
}

} // namespace ghd
