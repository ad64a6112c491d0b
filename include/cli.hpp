/**
 * @file cli.hpp
 * @brief Command line parsing for ghdigest.
 */

#ifndef GHDIGEST_CLI_HPP
#define GHDIGEST_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace ghd {

/**
 * Signals that CLI parsing requested an immediate exit (help, version or a
 * usage error). Carries the exit code back to the entry point.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// What a run does with the computed report.
enum class RunMode {
  Send,      ///< Deliver the e-mail
  Print,     ///< Write the full e-mail to stdout
  PrintBody, ///< Write only the report body to stdout
  DumpRepos  ///< Print resolved repositories and policies, fetch nothing
};

/// Parsed command line options.
struct CliOptions {
  std::string config_file;              ///< Empty selects the default path
  RunMode mode{RunMode::Send};
  bool save{true};                      ///< Persist state after the run
  bool verbose{false};                  ///< Shorthand for debug logging
  std::optional<std::string> log_level; ///< Overrides the config file
  std::optional<std::string> log_file;  ///< Overrides the config file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides
};

/**
 * Parse command line arguments.
 *
 * @throws CliParseExit When help or version output was requested or the
 *         arguments were rejected.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace ghd

#endif // GHDIGEST_CLI_HPP
