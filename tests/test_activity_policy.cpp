#include "activity_policy.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace ghd;

namespace {
RepoPolicyEntry entry(const std::string &pattern, PolicyKey key, bool value,
                      bool include = true) {
  RepoPolicyEntry e;
  e.pattern = RepoPattern::parse(pattern);
  e.layer.set(key, value);
  e.include = include;
  return e;
}
} // namespace

TEST_CASE("activity policy defaults") {
  ActivityPolicy policy;
  for (ActivityType type : kAllActivityTypes) {
    CHECK(policy.tracks(type));
  }
  CHECK(policy.get(PolicyKey::Prereleases));
  CHECK(policy.get(PolicyKey::Drafts));
  CHECK_FALSE(policy.get(PolicyKey::ReleasedTags));
  CHECK_FALSE(policy.get(PolicyKey::MyActivity));
  CHECK(policy.tracks_anything());
}

TEST_CASE("policy key names accept dashes and underscores") {
  CHECK(parse_policy_key("pull-requests") == PolicyKey::PullRequests);
  CHECK(parse_policy_key("pull_requests") == PolicyKey::PullRequests);
  CHECK(parse_policy_key("released_tags") == PolicyKey::ReleasedTags);
  CHECK(parse_policy_key("my-activity") == PolicyKey::MyActivity);
  CHECK_FALSE(parse_policy_key("commits"));
  CHECK(std::string(policy_key_name(PolicyKey::Stars)) == "stars");
  CHECK(policy_key_for(ActivityType::Fork) == PolicyKey::Forks);
}

TEST_CASE("policy layer from json") {
  auto layer = PolicyLayer::from_json(
      nlohmann::json{{"issues", false}, {"my_activity", true}}, "activity");
  CHECK(layer.get(PolicyKey::Issues) == false);
  CHECK(layer.get(PolicyKey::MyActivity) == true);
  CHECK_FALSE(layer.get(PolicyKey::Stars));
  CHECK_FALSE(layer.empty());
  CHECK(PolicyLayer{}.empty());

  CHECK_THROWS_AS(
      PolicyLayer::from_json(nlohmann::json{{"commits", true}}, "activity"),
      ConfigError);
  CHECK_THROWS_AS(
      PolicyLayer::from_json(nlohmann::json{{"issues", "yes"}}, "activity"),
      ConfigError);
  CHECK_THROWS_AS(PolicyLayer::from_json(nlohmann::json::array(), "activity"),
                  ConfigError);
  CHECK_THROWS_AS(
      PolicyLayer::from_json(nlohmann::json{{"include", true}}, "activity"),
      ConfigError);

  std::optional<bool> include;
  auto repo_layer = PolicyLayer::from_json(
      nlohmann::json{{"include", false}, {"tags", true}}, "repo", &include);
  REQUIRE(include);
  CHECK_FALSE(*include);
  CHECK(repo_layer.get(PolicyKey::Tags) == true);
}

TEST_CASE("policy precedence runs exact, owner, affiliated, global") {
  RepoRef widget{"R_1", "acme", "widget"};
  PolicyConfig config;
  config.global.set(PolicyKey::Issues, true);
  config.affiliated.set(PolicyKey::Issues, false);

  SECTION("affiliated layer beats global") {
    CHECK_FALSE(policy_for(widget, true, config).tracks(ActivityType::Issue));
  }
  SECTION("affiliated layer ignored for unaffiliated repositories") {
    CHECK(policy_for(widget, false, config).tracks(ActivityType::Issue));
  }
  SECTION("owner wildcard beats affiliated") {
    config.repos.push_back(entry("acme/*", PolicyKey::Issues, true));
    CHECK(policy_for(widget, true, config).tracks(ActivityType::Issue));
  }
  SECTION("exact entry beats owner wildcard regardless of order") {
    config.repos.push_back(entry("acme/*", PolicyKey::Issues, true));
    config.repos.push_back(entry("ACME/Widget", PolicyKey::Issues, false));
    CHECK_FALSE(policy_for(widget, true, config).tracks(ActivityType::Issue));
    RepoRef gadget{"R_2", "acme", "gadget"};
    CHECK(policy_for(gadget, true, config).tracks(ActivityType::Issue));
  }
  SECTION("unset keys fall back to defaults") {
    auto policy = policy_for(widget, true, config);
    CHECK(policy.tracks(ActivityType::Star));
    CHECK_FALSE(policy.get(PolicyKey::ReleasedTags));
  }
}

TEST_CASE("implicit includes skip entries with include disabled") {
  PolicyConfig config;
  config.repos.push_back(entry("acme/*", PolicyKey::Stars, false));
  config.repos.push_back(entry("acme/secret", PolicyKey::Stars, false, false));
  auto patterns = implicit_includes(config);
  REQUIRE(patterns.size() == 1);
  CHECK(patterns[0] == RepoPattern::parse("acme/*"));
}

TEST_CASE("policy serializes with dashed key names") {
  ActivityPolicy policy;
  policy.set(PolicyKey::Stars, false);
  auto j = policy_to_json(policy);
  CHECK(j.size() == kPolicyKeyCount);
  CHECK(j["stars"] == false);
  CHECK(j["pull-requests"] == true);
  CHECK(j["released-tags"] == false);
}

TEST_CASE("tracked types follow the enabled keys") {
  ActivityPolicy policy;
  for (ActivityType type : kAllActivityTypes) {
    policy.set(policy_key_for(type), false);
  }
  CHECK_FALSE(policy.tracks_anything());
  policy.set(PolicyKey::Releases, true);
  REQUIRE(policy.tracked_types().size() == 1);
  CHECK(policy.tracked_types()[0] == ActivityType::Release);
}
