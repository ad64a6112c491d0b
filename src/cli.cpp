#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace ghd {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < kLogCategories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << kLogCategories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., diff=debug).";
  oss << " Configuration files accept the same mapping under 'log-categories'.";
  return oss.str();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CliOptions options;
  CLI::App app{"Report new activity on your GitHub repositories by e-mail"};
  app.footer(log_category_help_text());

  app.add_option("-c,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "-V,--version",
         [](std::size_t) {
           std::cout << "ghdigest " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  bool dump_repos = false;
  bool print = false;
  bool print_body = false;
  auto *dump_opt =
      app.add_flag("--dump-repos", dump_repos,
                   "Print the tracked repositories and their activity "
                   "preferences as JSON and exit")
          ->group("Mode");
  auto *print_opt =
      app.add_flag("--print", print, "Print the e-mail instead of sending it")
          ->group("Mode");
  auto *body_opt = app.add_flag("--print-body", print_body,
                                "Print the e-mail body instead of sending it")
                       ->group("Mode");
  dump_opt->excludes(print_opt)->excludes(body_opt);
  print_opt->excludes(body_opt);
  app.add_flag("--save,!--no-save", options.save,
               "Whether to update the state file (default: save)")
      ->group("Mode");

  std::string log_level;
  auto *level_opt =
      app.add_option(
             "-l,--log-level", log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->group("Logging");
  app.add_flag("-v,--verbose", options.verbose,
               "Shorthand for --log-level debug")
      ->group("Logging");
  std::string log_file;
  auto *file_opt =
      app.add_option("--log-file", log_file, "Also write logs to FILE")
          ->type_name("FILE")
          ->group("Logging");
  std::vector<std::string> categories;
  app.add_option("--log-category", categories,
                 "Override a logging category (NAME or NAME=LEVEL). See help "
                 "footer for available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  try {
    app.parse(argc, argv);
    for (const auto &value : categories) {
      auto pos = value.find('=');
      std::string name =
          pos == std::string::npos ? value : value.substr(0, pos);
      std::string level = pos == std::string::npos ? std::string{"debug"}
                                                   : value.substr(pos + 1);
      if (name.empty()) {
        throw CLI::ValidationError("--log-category",
                                   "category name must not be empty");
      }
      options.log_categories[name] = level.empty() ? "debug" : level;
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (dump_repos) {
    options.mode = RunMode::DumpRepos;
  } else if (print) {
    options.mode = RunMode::Print;
  } else if (print_body) {
    options.mode = RunMode::PrintBody;
  }
  if (level_opt->count() > 0U) {
    options.log_level = log_level;
  }
  if (file_opt->count() > 0U) {
    options.log_file = log_file;
  }
  cli_log()->debug("Parsed command line ({} argument(s))", argc - 1);
  return options;
}

} // namespace ghd
