#include "diff_engine.hpp"
#include "errors.hpp"
#include "github_source.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <deque>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ghd;
using nlohmann::json;

namespace {

/// Replays queued responses and records every request.
class ScriptedHttp : public HttpClient {
public:
  struct Request {
    std::string url;
    json body;
    std::vector<std::string> headers;
  };
  std::deque<HttpResponse> responses;
  std::vector<Request> requests;

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers) override {
    requests.push_back({url, json::parse(body), headers});
    if (responses.empty()) {
      throw std::logic_error("unexpected request");
    }
    HttpResponse resp = responses.front();
    responses.pop_front();
    if (resp.status_code >= 500) {
      throw HttpStatusError(static_cast<int>(resp.status_code), "server error");
    }
    return resp;
  }

  void reply(const json &doc, long status = 200,
             std::vector<std::string> headers = {}) {
    responses.push_back({doc.dump(), std::move(headers), status});
  }
};

struct Fixture {
  ScriptedHttp *http;
  std::unique_ptr<GitHubGraphQLClient> client;
  std::vector<std::chrono::milliseconds> waits;

  explicit Fixture(int retries = 2) {
    auto owned = std::make_unique<ScriptedHttp>();
    http = owned.get();
    RetryPolicy retry = RetryPolicy::with_retries(retries);
    retry.sleep = [this](std::chrono::milliseconds w) { waits.push_back(w); };
    client = std::make_unique<GitHubGraphQLClient>(
        "tok", std::move(owned), "https://api.example.test/graphql", retry);
  }
};

json repo_node(const std::string &id, const std::string &owner,
               const std::string &name) {
  return {{"id", id},
          {"owner", {{"login", owner}}},
          {"name", name},
          {"url", "https://github.com/" + owner + "/" + name},
          {"description", nullptr}};
}

json page(json nodes, bool more, const std::string &cursor = "c1") {
  return {{"nodes", std::move(nodes)},
          {"pageInfo", {{"endCursor", cursor}, {"hasNextPage", more}}}};
}

json node_data(const std::string &field, json connection) {
  return {{"data", {{"node", {{field, std::move(connection)}}}}}};
}

json issue_node(int number, const std::string &created, bool viewer = false) {
  return {{"author", {{"login", viewer ? "me" : "octocat"}, {"isViewer", viewer}}},
          {"createdAt", created},
          {"number", number},
          {"title", "Issue " + std::to_string(number)},
          {"url", "https://github.com/acme/widget/issues/" +
                      std::to_string(number)}};
}

const RepoRef kWidget{"R_widget", "acme", "widget",
                      "https://github.com/acme/widget"};

} // namespace

TEST_CASE("requests carry auth and id headers") {
  Fixture f;
  f.http->reply({{"data", {{"repository", repo_node("R_1", "acme", "widget")}}}});
  auto repo = f.client->get_repository("acme", "widget");
  CHECK(repo.id == "R_1");
  CHECK(repo.full_name() == "acme/widget");
  CHECK(repo.description.empty());

  REQUIRE(f.http->requests.size() == 1);
  const auto &req = f.http->requests[0];
  CHECK(req.url == "https://api.example.test/graphql");
  CHECK(req.body["variables"]["owner"] == "acme");
  CHECK(req.body["variables"]["name"] == "widget");
  CHECK(std::find(req.headers.begin(), req.headers.end(),
                  "Authorization: bearer tok") != req.headers.end());
  CHECK(std::find(req.headers.begin(), req.headers.end(),
                  "X-Github-Next-Global-ID: 1") != req.headers.end());
}

TEST_CASE("missing repositories raise NotFoundError") {
  Fixture f;
  f.http->reply({{"data", {{"repository", nullptr}}},
                 {"errors",
                  json::array({{{"type", "NOT_FOUND"},
                                {"message", "Could not resolve"}}})}});
  CHECK_THROWS_AS(f.client->get_repository("acme", "gone"), NotFoundError);

  f.http->reply({{"data", {{"repositoryOwner", nullptr}}}});
  CHECK_THROWS_AS(f.client->list_repositories_under_owner("ghost"),
                  NotFoundError);
}

TEST_CASE("repository listings follow pagination") {
  Fixture f;
  f.http->reply({{"data",
                  {{"viewer",
                    {{"repositories",
                      page(json::array({repo_node("R_1", "me", "a")}), true,
                           "cursor-1")}}}}}});
  f.http->reply({{"data",
                  {{"viewer",
                    {{"repositories",
                      page(json::array({repo_node("R_2", "org", "b")}),
                           false)}}}}}});
  auto repos = f.client->list_affiliated_repositories(
      {Affiliation::Owner, Affiliation::Collaborator});
  REQUIRE(repos.size() == 2);
  CHECK(repos[0].full_name() == "me/a");
  CHECK(repos[1].full_name() == "org/b");

  REQUIRE(f.http->requests.size() == 2);
  CHECK(f.http->requests[0].body["variables"]["cursor"].is_null());
  CHECK(f.http->requests[0].body["variables"]["affiliations"] ==
        json::array({"OWNER", "COLLABORATOR"}));
  CHECK(f.http->requests[0].body["variables"]["page_size"] == kGraphQLPageSize);
  CHECK(f.http->requests[1].body["variables"]["cursor"] == "cursor-1");
}

TEST_CASE("activity paging stops at the cutoff and returns oldest first") {
  Fixture f;
  auto after = parse_timestamp("2024-05-01T00:00:00Z");
  f.http->reply(node_data(
      "issues", page(json::array({issue_node(3, "2024-05-03T00:00:00Z"),
                                  issue_node(2, "2024-05-02T00:00:00Z", true)}),
                     true, "next")));
  f.http->reply(node_data(
      "issues", page(json::array({issue_node(1, "2024-05-01T00:00:00Z"),
                                  issue_node(0, "2024-04-30T00:00:00Z")}),
                     true, "more")));
  auto events = f.client->list_events(kWidget, ActivityType::Issue, after);
  REQUIRE(events.size() == 2);
  CHECK(events[0].number == 2);
  CHECK(events[0].author == "me");
  CHECK(events[0].author_is_viewer);
  CHECK(events[1].number == 3);
  CHECK(events[1].repo.id == "R_widget");
  CHECK(events[1].url == "https://github.com/acme/widget/issues/3");
  CHECK(f.http->requests.size() == 2);
  CHECK(f.http->requests[0].body["variables"]["repo_id"] == "R_widget");
  CHECK(f.http->requests[1].body["variables"]["cursor"] == "next");
}

TEST_CASE("releases use publication time and carry their flags") {
  Fixture f;
  json rel = {{"id", "RE_1"},
              {"author", {{"login", "octocat"}, {"isViewer", false}}},
              {"createdAt", "2024-05-02T00:00:00Z"},
              {"publishedAt", "2024-05-04T00:00:00Z"},
              {"name", "One"},
              {"tagName", "v1.0"},
              {"url", "https://github.com/acme/widget/releases/tag/v1.0"},
              {"description", "Notes"},
              {"isDraft", false},
              {"isPrerelease", true}};
  json draft = {{"id", "RE_2"},
                {"author", nullptr},
                {"createdAt", "2024-05-03T00:00:00Z"},
                {"publishedAt", nullptr},
                {"name", nullptr},
                {"tagName", "v2.0"},
                {"url", "https://github.com/acme/widget/releases/tag/untagged"},
                {"description", nullptr},
                {"isDraft", true},
                {"isPrerelease", false}};
  f.http->reply(node_data("releases", page(json::array({draft, rel}), false)));
  auto events = f.client->list_events(kWidget, ActivityType::Release,
                                      parse_timestamp("2024-05-01T00:00:00Z"));
  REQUIRE(events.size() == 2);
  CHECK(events[0].release_id == "RE_1");
  CHECK(events[0].timestamp == parse_timestamp("2024-05-04T00:00:00Z"));
  CHECK(events[0].prerelease);
  CHECK(events[0].body == "Notes");
  CHECK(events[1].release_id == "RE_2");
  CHECK(events[1].draft);
  CHECK(events[1].timestamp == parse_timestamp("2024-05-03T00:00:00Z"));
  CHECK(events[1].author.empty());
}

namespace {
json release_node(const std::string &id, const std::string &created,
                  const std::string &published, bool draft) {
  return {{"id", id},
          {"author", {{"login", "octocat"}, {"isViewer", false}}},
          {"createdAt", created},
          {"publishedAt", published.empty() ? json() : json(published)},
          {"name", id},
          {"tagName", "v-" + id},
          {"url", "https://github.com/acme/widget/releases/tag/v-" + id},
          {"description", nullptr},
          {"isDraft", draft},
          {"isPrerelease", false}};
}
} // namespace

TEST_CASE("release paging continues past the cutoff for pending drafts") {
  Fixture f;
  auto after = parse_timestamp("2024-05-02T00:00:00Z");

  SECTION("every pending draft found") {
    f.http->reply(node_data(
        "releases",
        page(json::array(
                 {release_node("RE_5", "2024-05-05T00:00:00Z",
                               "2024-05-05T00:00:00Z", false),
                  release_node("RE_1", "2024-05-01T00:00:00Z",
                               "2024-06-02T00:00:00Z", false)}),
             true)));
    std::set<std::string> gone;
    auto events = f.client->list_releases(kWidget, after, {"RE_1"}, gone);
    CHECK(f.http->requests.size() == 1);
    REQUIRE(events.size() == 2);
    CHECK(events[0].release_id == "RE_1");
    CHECK(events[1].release_id == "RE_5");
    CHECK(gone.empty());
  }
  SECTION("deleted drafts are reported as gone") {
    f.http->reply(node_data(
        "releases",
        page(json::array({release_node("RE_1", "2024-05-01T00:00:00Z", "",
                                       true),
                          release_node("RE_0", "2024-04-20T00:00:00Z",
                                       "2024-04-20T00:00:00Z", false)}),
             true, "next")));
    f.http->reply(node_data(
        "releases",
        page(json::array({release_node("RE_A", "2024-03-01T00:00:00Z",
                                       "2024-03-01T00:00:00Z", false)}),
             false)));
    std::set<std::string> gone;
    auto events =
        f.client->list_releases(kWidget, after, {"RE_1", "RE_GONE"}, gone);
    CHECK(f.http->requests.size() == 2);
    REQUIRE(events.size() == 1);
    CHECK(events[0].release_id == "RE_1");
    CHECK(events[0].draft);
    CHECK(gone == std::set<std::string>{"RE_GONE"});
  }
}

TEST_CASE("a published draft is suppressed across runs") {
  Fixture f;
  ActivityPolicy releases_only;
  for (PolicyKey key : {PolicyKey::Issues, PolicyKey::PullRequests,
                        PolicyKey::Discussions, PolicyKey::Tags,
                        PolicyKey::Stars, PolicyKey::Forks}) {
    releases_only.set(key, false);
  }
  std::vector<PlannedRepository> plan{{kWidget, releases_only}};
  RepoState known;
  known.owner = "acme";
  known.name = "widget";
  known.cutoffs[ActivityType::Release] = parse_timestamp("2024-05-01T00:00:00Z");
  DiffEngine engine(*f.client);
  const Timestamp now = parse_timestamp("2024-07-01T00:00:00Z");

  f.http->reply(node_data(
      "releases",
      page(json::array(
               {release_node("RE_1", "2024-05-02T00:00:00Z", "", true)}),
           false)));
  auto first = engine.diff(plan, {{kWidget.id, known}}, now);
  REQUIRE(first.events.size() == 1);
  CHECK(first.events[0].draft);
  CHECK(first.next_state.at(kWidget.id).seen_draft_release_ids ==
        std::set<std::string>{"RE_1"});

  f.http->reply(node_data(
      "releases",
      page(json::array({release_node("RE_1", "2024-05-02T00:00:00Z",
                                     "2024-06-02T00:00:00Z", false)}),
           true)));
  auto second = engine.diff(plan, first.next_state, now);
  CHECK(second.events.empty());
  const auto &state = second.next_state.at(kWidget.id);
  CHECK(state.seen_draft_release_ids.empty());
  CHECK(state.cutoffs.at(ActivityType::Release) ==
        parse_timestamp("2024-06-02T00:00:00Z"));
  CHECK(f.http->requests.size() == 2);
}

TEST_CASE("tags take tagger or commit dates and skip undated tags") {
  Fixture f;
  json annotated = {{"name", "v2.0"},
                    {"target",
                     {{"__typename", "Tag"},
                      {"tagger",
                       {{"date", "2024-05-03T10:00:00+02:00"},
                        {"user", {{"login", "octocat"}, {"isViewer", false}}}}}}}};
  json lightweight = {{"name", "v1.0"},
                      {"target",
                       {{"__typename", "Commit"},
                        {"committedDate", "2024-05-02T00:00:00Z"},
                        {"author", {{"user", nullptr}}}}}};
  json bogus = {{"name", "weird"}, {"target", {{"__typename", "Blob"}}}};
  f.http->reply(
      node_data("refs", page(json::array({annotated, bogus, lightweight}), false)));
  auto events = f.client->list_events(kWidget, ActivityType::Tag,
                                      parse_timestamp("2024-05-01T00:00:00Z"));
  REQUIRE(events.size() == 2);
  CHECK(events[0].name == "v1.0");
  CHECK(events[0].author.empty());
  CHECK(events[1].name == "v2.0");
  CHECK(events[1].author == "octocat");
  CHECK(events[1].timestamp == parse_timestamp("2024-05-03T08:00:00Z"));
}

TEST_CASE("stars and forks are parsed") {
  Fixture f;
  json stars = {{"edges",
                 json::array({{{"starredAt", "2024-05-02T00:00:00Z"},
                               {"node", {{"login", "fan"}, {"isViewer", false}}}}})},
                {"pageInfo", {{"endCursor", "x"}, {"hasNextPage", false}}}};
  f.http->reply(node_data("stargazers", stars));
  auto starred = f.client->list_events(kWidget, ActivityType::Star,
                                       parse_timestamp("2024-05-01T00:00:00Z"));
  REQUIRE(starred.size() == 1);
  CHECK(starred[0].author == "fan");

  json fork = {{"createdAt", "2024-05-02T00:00:00Z"},
               {"url", "https://github.com/fan/widget"},
               {"owner", {{"login", "fan"}}}};
  f.http->reply(node_data("forks", page(json::array({fork}), false)));
  auto forks = f.client->list_events(kWidget, ActivityType::Fork,
                                     parse_timestamp("2024-05-01T00:00:00Z"));
  REQUIRE(forks.size() == 1);
  CHECK(forks[0].fork_url == "https://github.com/fan/widget");
  CHECK_FALSE(forks[0].author_is_viewer);
}

TEST_CASE("server errors are retried then reported as transient") {
  Fixture f(2);
  f.http->reply(json::object(), 502);
  f.http->reply(json::object(), 503);
  f.http->reply(json::object(), 500);
  CHECK_THROWS_AS(f.client->list_events(kWidget, ActivityType::Issue,
                                        parse_timestamp("2024-05-01T00:00:00Z")),
                  TransientFetchError);
  CHECK(f.http->requests.size() == 3);
  CHECK(f.waits.size() == 2);
}

TEST_CASE("rate limits honour Retry-After") {
  Fixture f(2);
  f.http->reply(json::object(), 403, {"Retry-After: 3"});
  f.http->reply({{"data", {{"repository", repo_node("R_1", "acme", "widget")}}}});
  auto repo = f.client->get_repository("acme", "widget");
  CHECK(repo.id == "R_1");
  REQUIRE(f.waits.size() == 1);
  CHECK(f.waits[0] == std::chrono::milliseconds(3000));
}

TEST_CASE("GraphQL errors and forbidden responses are fatal") {
  Fixture f;
  f.http->reply({{"errors", json::array({{{"message", "Bad query"}}})}});
  CHECK_THROWS_AS(f.client->query("{ viewer { login } }", json::object()),
                  FatalFetchError);

  f.http->reply(json::object(), 403);
  CHECK_THROWS_AS(f.client->query("{ viewer { login } }", json::object()),
                  FatalFetchError);
  CHECK(f.waits.empty());
}

TEST_CASE("vanished repositories are transient during activity fetches") {
  Fixture f;
  f.http->reply({{"data", {{"node", nullptr}}}});
  CHECK_THROWS_AS(f.client->list_events(kWidget, ActivityType::Issue,
                                        parse_timestamp("2024-05-01T00:00:00Z")),
                  TransientFetchError);
}

TEST_CASE("malformed activity payloads are fatal") {
  Fixture f;
  f.http->reply(node_data(
      "issues", page(json::array({{{"createdAt", "not a date"}, {"number", 1}}}),
                     false)));
  CHECK_THROWS_AS(f.client->list_events(kWidget, ActivityType::Issue,
                                        parse_timestamp("2024-05-01T00:00:00Z")),
                  FatalFetchError);
}
