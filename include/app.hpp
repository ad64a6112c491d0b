#ifndef GHDIGEST_APP_HPP
#define GHDIGEST_APP_HPP

#include "activity_source.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "diff_engine.hpp"
#include "notification.hpp"
#include "repo_set.hpp"
#include "util/time.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

namespace ghd {

/**
 * Application wrapper handling CLI parsing, configuration, and a single
 * digest run.
 */
class App {
public:
  using SourceFactory =
      std::function<std::unique_ptr<ActivitySource>(const Config &)>;
  using NotifierFactory =
      std::function<std::unique_ptr<Notifier>(const Config &)>;
  using Clock = std::function<Timestamp()>;

  App();

  /**
   * Run the application.
   *
   * @return Process exit code: 0 on success, 2 for configuration and usage
   *         errors, 1 for any other failure.
   */
  int run(int argc, char **argv);

  /// Replace the GitHub client factory.
  void set_source_factory(SourceFactory factory) {
    source_factory_ = std::move(factory);
  }

  /// Replace the factory building the mail notifier.
  void set_notifier_factory(NotifierFactory factory) {
    notifier_factory_ = std::move(factory);
  }

  /// Stream receiving `--print`, `--print-body` and `--dump-repos` output.
  void set_output(std::ostream &out) { out_ = &out; }

  /// Clock providing the detection time of a run.
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  const CliOptions &options() const { return options_; }

  const Config &config() const { return config_; }

private:
  void load_config();
  void configure_logging() const;
  int execute();

  CliOptions options_;
  Config config_;
  SourceFactory source_factory_;
  NotifierFactory notifier_factory_;
  std::ostream *out_;
  Clock clock_;
};

/// Pair every tracked repository with its resolved activity policy.
std::vector<PlannedRepository>
plan_repositories(const std::vector<TrackedRepository> &tracked,
                  const PolicyConfig &policies);

/**
 * JSON object mapping `owner/name` to the repository's activity policy, as
 * printed by `--dump-repos`.
 */
nlohmann::json dump_repo_policies(const std::vector<PlannedRepository> &repos);

} // namespace ghd

#endif // GHDIGEST_APP_HPP
