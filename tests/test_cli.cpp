#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>

TEST_CASE("test cli", "[cli]") {
  char prog[] = "prog";
  char *argv0[] = {prog};
  ghd::CliOptions defaults = ghd::parse_cli(1, argv0);
  REQUIRE(defaults.config_file.empty());
  REQUIRE(defaults.mode == ghd::RunMode::Send);
  REQUIRE(defaults.save);
  REQUIRE_FALSE(defaults.verbose);
  REQUIRE_FALSE(defaults.log_level);
  REQUIRE_FALSE(defaults.log_file);
  REQUIRE(defaults.log_categories.empty());

  char verbose[] = "-v";
  char *argv1[] = {prog, verbose};
  REQUIRE(ghd::parse_cli(2, argv1).verbose);

  char config_flag[] = "--config";
  char file[] = "cfg.toml";
  char *argv2[] = {prog, config_flag, file};
  REQUIRE(ghd::parse_cli(3, argv2).config_file == "cfg.toml");

  char log_flag[] = "--log-level";
  char info_lvl[] = "info";
  char log_file_flag[] = "--log-file";
  char path[] = "ghdigest.log";
  char *argv3[] = {prog, log_flag, info_lvl, log_file_flag, path};
  ghd::CliOptions opts3 = ghd::parse_cli(5, argv3);
  REQUIRE(opts3.log_level == "info");
  REQUIRE(opts3.log_file == "ghdigest.log");
}

TEST_CASE("cli run modes", "[cli]") {
  char prog[] = "prog";
  char print[] = "--print";
  char print_body[] = "--print-body";
  char dump[] = "--dump-repos";
  char no_save[] = "--no-save";

  char *argv1[] = {prog, print};
  REQUIRE(ghd::parse_cli(2, argv1).mode == ghd::RunMode::Print);

  char *argv2[] = {prog, print_body, no_save};
  ghd::CliOptions opts2 = ghd::parse_cli(3, argv2);
  REQUIRE(opts2.mode == ghd::RunMode::PrintBody);
  REQUIRE_FALSE(opts2.save);

  char *argv3[] = {prog, dump};
  REQUIRE(ghd::parse_cli(2, argv3).mode == ghd::RunMode::DumpRepos);

  char *argv4[] = {prog, print, print_body};
  REQUIRE_THROWS_AS(ghd::parse_cli(3, argv4), ghd::CliParseExit);

  char *argv5[] = {prog, dump, print};
  REQUIRE_THROWS_AS(ghd::parse_cli(3, argv5), ghd::CliParseExit);
}

TEST_CASE("cli log categories", "[cli]") {
  char prog[] = "prog";
  char flag[] = "--log-category";
  char diff[] = "diff";
  char http[] = "http=trace";
  char empty_level[] = "state=";
  char *argv1[] = {prog, flag, diff, flag, http, flag, empty_level};
  ghd::CliOptions opts = ghd::parse_cli(7, argv1);
  REQUIRE(opts.log_categories.size() == 3);
  REQUIRE(opts.log_categories.at("diff") == "debug");
  REQUIRE(opts.log_categories.at("http") == "trace");
  REQUIRE(opts.log_categories.at("state") == "debug");

  char nameless[] = "=info";
  char *argv2[] = {prog, flag, nameless};
  REQUIRE_THROWS_AS(ghd::parse_cli(3, argv2), ghd::CliParseExit);
}

TEST_CASE("cli rejects unknown options", "[cli]") {
  char prog[] = "prog";
  char bogus[] = "--bogus";
  char *argv[] = {prog, bogus};
  try {
    ghd::parse_cli(2, argv);
    FAIL("expected CliParseExit");
  } catch (const ghd::CliParseExit &e) {
    REQUIRE(e.exit_code() != 0);
  }

  char help[] = "--help";
  char *argv2[] = {prog, help};
  try {
    ghd::parse_cli(2, argv2);
    FAIL("expected CliParseExit");
  } catch (const ghd::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
}
