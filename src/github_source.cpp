/**
 * @file github_source.cpp
 * @brief GraphQL queries for repository listings and activity.
 *
 * Activity connections are requested newest first and paged until an entry
 * is not newer than the cutoff; the collected events are returned oldest
 * first. Release paging continues past the cutoff while draft releases
 * reported earlier have not been found.
 */

#include "github_source.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> github_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

const char *const kRepoFields = "nodes { id owner { login } name url description } "
                                "pageInfo { endCursor hasNextPage }";

const char *const kIssueoidFields =
    "nodes { author { login ... on User { isViewer } } createdAt number title "
    "url } pageInfo { endCursor hasNextPage }";

/// Shape of one activity connection.
struct ConnectionSpec {
  const char *field;   ///< Connection field on Repository
  const char *args;    ///< Extra connection arguments (ordering)
  const char *selection;
  bool edges;          ///< Entries live under `edges` instead of `nodes`
};

ConnectionSpec connection_for(ActivityType type) {
  switch (type) {
  case ActivityType::Issue:
    return {"issues", "orderBy: {field: CREATED_AT, direction: DESC}",
            kIssueoidFields, false};
  case ActivityType::PullRequest:
    return {"pullRequests", "orderBy: {field: CREATED_AT, direction: DESC}",
            kIssueoidFields, false};
  case ActivityType::Discussion:
    return {"discussions", "orderBy: {field: CREATED_AT, direction: DESC}",
            kIssueoidFields, false};
  case ActivityType::Release:
    return {"releases", "orderBy: {field: CREATED_AT, direction: DESC}",
            "nodes { id author { login isViewer } createdAt publishedAt name "
            "tagName url description isDraft isPrerelease } "
            "pageInfo { endCursor hasNextPage }",
            false};
  case ActivityType::Tag:
    return {"refs",
            "refPrefix: \"refs/tags/\", "
            "orderBy: {field: TAG_COMMIT_DATE, direction: DESC}",
            "nodes { name target { __typename "
            "... on Commit { committedDate author { user { login isViewer } } } "
            "... on Tag { tagger { date user { login isViewer } } } } } "
            "pageInfo { endCursor hasNextPage }",
            false};
  case ActivityType::Star:
    return {"stargazers", "orderBy: {field: STARRED_AT, direction: DESC}",
            "edges { starredAt node { login isViewer } } "
            "pageInfo { endCursor hasNextPage }",
            true};
  case ActivityType::Fork:
    return {"forks", "orderBy: {field: CREATED_AT, direction: DESC}",
            "nodes { createdAt url owner { login ... on User { isViewer } } } "
            "pageInfo { endCursor hasNextPage }",
            false};
  }
  throw std::logic_error("unhandled activity type");
}

std::string string_or_empty(const nlohmann::json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return {};
  return it->get<std::string>();
}

/// Fill author fields from an actor/user object that may be null.
void set_author(Event &ev, const nlohmann::json &actor) {
  if (!actor.is_object())
    return;
  ev.author = string_or_empty(actor, "login");
  auto viewer = actor.find("isViewer");
  ev.author_is_viewer = viewer != actor.end() && viewer->is_boolean() &&
                        viewer->get<bool>();
}

/**
 * Convert one connection entry into an event.
 *
 * @param order_key Receives the timestamp the connection is ordered by.
 * @return The event, or std::nullopt for entries that carry no usable
 *         timestamp.
 */
std::optional<Event> parse_entry(const RepoRef &repo, ActivityType type,
                                 const nlohmann::json &node,
                                 Timestamp &order_key) {
  Event ev;
  ev.type = type;
  ev.repo = repo;
  switch (type) {
  case ActivityType::Issue:
  case ActivityType::PullRequest:
  case ActivityType::Discussion:
    ev.timestamp = parse_timestamp(node.at("createdAt").get<std::string>());
    ev.number = node.at("number").get<int>();
    ev.title = string_or_empty(node, "title");
    ev.url = string_or_empty(node, "url");
    set_author(ev, node.value("author", nlohmann::json()));
    order_key = ev.timestamp;
    break;
  case ActivityType::Release: {
    order_key = parse_timestamp(node.at("createdAt").get<std::string>());
    std::string published = string_or_empty(node, "publishedAt");
    ev.timestamp = published.empty() ? order_key : parse_timestamp(published);
    ev.release_id = node.at("id").get<std::string>();
    ev.tag_name = string_or_empty(node, "tagName");
    ev.name = string_or_empty(node, "name");
    ev.url = string_or_empty(node, "url");
    ev.body = string_or_empty(node, "description");
    ev.draft = node.value("isDraft", false);
    ev.prerelease = node.value("isPrerelease", false);
    set_author(ev, node.value("author", nlohmann::json()));
    break;
  }
  case ActivityType::Tag: {
    ev.name = node.at("name").get<std::string>();
    const auto &target = node.at("target");
    std::string kind = target.is_object() ? string_or_empty(target, "__typename")
                                          : std::string();
    std::string stamp;
    if (kind == "Commit") {
      stamp = string_or_empty(target, "committedDate");
      auto author = target.value("author", nlohmann::json());
      if (author.is_object())
        set_author(ev, author.value("user", nlohmann::json()));
    } else if (kind == "Tag") {
      auto tagger = target.value("tagger", nlohmann::json());
      if (tagger.is_object()) {
        stamp = string_or_empty(tagger, "date");
        set_author(ev, tagger.value("user", nlohmann::json()));
      }
    }
    if (stamp.empty()) {
      github_log()->warn("Tag {} on {} has no usable date; ignoring", ev.name,
                         repo.full_name());
      return std::nullopt;
    }
    ev.timestamp = parse_timestamp(stamp);
    order_key = ev.timestamp;
    break;
  }
  case ActivityType::Star:
    ev.timestamp = parse_timestamp(node.at("starredAt").get<std::string>());
    set_author(ev, node.at("node"));
    order_key = ev.timestamp;
    break;
  case ActivityType::Fork:
    ev.timestamp = parse_timestamp(node.at("createdAt").get<std::string>());
    ev.fork_url = string_or_empty(node, "url");
    set_author(ev, node.value("owner", nlohmann::json()));
    order_key = ev.timestamp;
    break;
  }
  return ev;
}

RepoRef parse_repo(const nlohmann::json &node) {
  RepoRef repo;
  repo.id = node.at("id").get<std::string>();
  repo.owner = node.at("owner").at("login").get<std::string>();
  repo.name = node.at("name").get<std::string>();
  repo.url = string_or_empty(node, "url");
  repo.description = string_or_empty(node, "description");
  return repo;
}

std::chrono::seconds rate_limit_wait(const HttpResponse &resp) {
  if (auto retry_after = resp.header("Retry-After")) {
    try {
      return std::chrono::seconds(std::stol(*retry_after));
    } catch (const std::exception &) {
      github_log()->debug("Ignoring malformed Retry-After '{}'", *retry_after);
    }
  }
  if (auto reset = resp.header("X-RateLimit-Reset")) {
    try {
      auto reset_at = std::chrono::system_clock::time_point(
          std::chrono::seconds(std::stoll(*reset)));
      auto now = std::chrono::system_clock::now();
      if (reset_at > now) {
        return std::chrono::duration_cast<std::chrono::seconds>(reset_at - now);
      }
    } catch (const std::exception &) {
      github_log()->debug("Ignoring malformed X-RateLimit-Reset '{}'", *reset);
    }
  }
  return std::chrono::seconds(0);
}

} // namespace

GitHubGraphQLClient::GitHubGraphQLClient(std::string token,
                                         std::unique_ptr<HttpClient> http,
                                         std::string api_url, RetryPolicy retry)
    : token_(std::move(token)),
      http_(http ? std::move(http) : std::make_unique<CurlHttpClient>()),
      api_url_(std::move(api_url)), retry_(std::move(retry)) {}

nlohmann::json GitHubGraphQLClient::query_once(const std::string &payload) {
  std::vector<std::string> headers{"Authorization: bearer " + token_,
                                   "X-Github-Next-Global-ID: 1",
                                   "Accept: application/json"};
  HttpResponse resp = http_->post(api_url_, payload, headers);
  if (resp.status_code == 429 ||
      (resp.status_code == 403 &&
       (resp.header("Retry-After") ||
        resp.header("X-RateLimit-Remaining").value_or("") == "0"))) {
    auto wait = rate_limit_wait(resp);
    github_log()->warn("Rate limited by GitHub (HTTP {}), wait {} s",
                       resp.status_code, wait.count());
    throw RateLimitError(static_cast<int>(resp.status_code), wait,
                         "GitHub rate limit exceeded");
  }
  if (resp.status_code == 403) {
    throw HttpStatusError(403, "GitHub denied access (HTTP 403)");
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(resp.body);
  } catch (const nlohmann::json::exception &e) {
    throw FatalFetchError(std::string("Malformed GraphQL response: ") +
                          e.what());
  }
  auto errors = doc.find("errors");
  if (errors != doc.end() && errors->is_array() && !errors->empty()) {
    std::string messages;
    bool not_found = false;
    bool rate_limited = false;
    for (const auto &err : *errors) {
      std::string type = err.is_object() ? string_or_empty(err, "type") : "";
      not_found = not_found || type == "NOT_FOUND";
      rate_limited = rate_limited || type == "RATE_LIMITED";
      if (!messages.empty())
        messages += "; ";
      messages += err.is_object() ? string_or_empty(err, "message") : err.dump();
    }
    if (rate_limited) {
      throw RateLimitError(200, std::chrono::seconds(0), messages);
    }
    if (not_found) {
      throw NotFoundError(messages);
    }
    throw FatalFetchError("GraphQL request failed: " + messages);
  }
  auto data = doc.find("data");
  if (data == doc.end() || !data->is_object()) {
    throw FatalFetchError("GraphQL response has no data");
  }
  return *data;
}

nlohmann::json GitHubGraphQLClient::query(const std::string &query,
                                          const nlohmann::json &variables) {
  const std::string payload =
      nlohmann::json{{"query", query}, {"variables", variables}}.dump();
  try {
    return retry_.run([&] { return query_once(payload); }, "GraphQL request");
  } catch (const NotFoundError &) {
    throw;
  } catch (const FatalFetchError &) {
    throw;
  } catch (const std::exception &e) {
    if (is_retryable_error(e)) {
      github_log()->error("GraphQL request failed after retries: {}", e.what());
      throw TransientFetchError(e.what());
    }
    github_log()->error("GraphQL request failed: {}", e.what());
    throw FatalFetchError(e.what());
  }
}

std::vector<RepoRef> GitHubGraphQLClient::list_repositories(
    const std::string &query_text, nlohmann::json variables,
    const std::vector<std::string> &path, const std::string &owner) {
  std::vector<RepoRef> repos;
  variables["page_size"] = kGraphQLPageSize;
  variables["cursor"] = nullptr;
  while (true) {
    nlohmann::json data = query(query_text, variables);
    try {
      const nlohmann::json *root = &data;
      for (const auto &step : path) {
        root = &root->at(step);
        if (root->is_null()) {
          throw NotFoundError("No such repository owner: " + owner);
        }
      }
      for (const auto &node : root->at("nodes")) {
        repos.push_back(parse_repo(node));
      }
      const auto &page = root->at("pageInfo");
      if (!page.at("hasNextPage").get<bool>()) {
        break;
      }
      variables["cursor"] = page.at("endCursor");
    } catch (const nlohmann::json::exception &e) {
      throw FatalFetchError(std::string("Unexpected repository listing: ") +
                            e.what());
    }
  }
  return repos;
}

std::vector<RepoRef> GitHubGraphQLClient::list_affiliated_repositories(
    const std::vector<Affiliation> &affiliations) {
  nlohmann::json names = nlohmann::json::array();
  for (Affiliation a : affiliations) {
    names.push_back(affiliation_name(a));
  }
  const std::string q =
      std::string("query($page_size: Int!, $affiliations: "
                  "[RepositoryAffiliation!], $cursor: String) { viewer { "
                  "repositories(ownerAffiliations: $affiliations, orderBy: "
                  "{field: NAME, direction: ASC}, first: $page_size, after: "
                  "$cursor) { ") +
      kRepoFields + " } } }";
  auto repos = list_repositories(q, {{"affiliations", names}},
                                 {"viewer", "repositories"}, "viewer");
  github_log()->debug("Viewer has {} affiliated repositories", repos.size());
  return repos;
}

std::vector<RepoRef>
GitHubGraphQLClient::list_repositories_under_owner(const std::string &owner) {
  const std::string q =
      std::string("query($owner: String!, $page_size: Int!, $cursor: String) "
                  "{ repositoryOwner(login: $owner) { repositories(orderBy: "
                  "{field: NAME, direction: ASC}, first: $page_size, after: "
                  "$cursor) { ") +
      kRepoFields + " } } }";
  auto repos = list_repositories(q, {{"owner", owner}},
                                 {"repositoryOwner", "repositories"}, owner);
  github_log()->debug("Owner {} has {} repositories", owner, repos.size());
  return repos;
}

RepoRef GitHubGraphQLClient::get_repository(const std::string &owner,
                                            const std::string &name) {
  const std::string q =
      "query($owner: String!, $name: String!) { repository(owner: $owner, "
      "name: $name) { id owner { login } name url description } }";
  nlohmann::json data = query(q, {{"owner", owner}, {"name", name}});
  auto it = data.find("repository");
  if (it == data.end() || it->is_null()) {
    throw NotFoundError("No such repository: " + owner + "/" + name);
  }
  try {
    return parse_repo(*it);
  } catch (const nlohmann::json::exception &e) {
    throw FatalFetchError(std::string("Unexpected repository response: ") +
                          e.what());
  }
}

std::vector<Event> GitHubGraphQLClient::list_events(const RepoRef &repo,
                                                    ActivityType type,
                                                    Timestamp after) {
  return fetch_activity(repo, type, after, nullptr, nullptr);
}

std::vector<Event>
GitHubGraphQLClient::list_releases(const RepoRef &repo, Timestamp after,
                                   const std::set<std::string> &drafts,
                                   std::set<std::string> &gone) {
  std::set<std::string> found;
  auto events =
      fetch_activity(repo, ActivityType::Release, after, &drafts, &found);
  for (const auto &id : drafts) {
    if (found.count(id) == 0) {
      gone.insert(id);
    }
  }
  return events;
}

std::vector<Event> GitHubGraphQLClient::fetch_activity(
    const RepoRef &repo, ActivityType type, Timestamp after,
    const std::set<std::string> *drafts, std::set<std::string> *found) {
  const ConnectionSpec spec = connection_for(type);
  const std::string q =
      std::string("query($repo_id: ID!, $page_size: Int!, $cursor: String) { "
                  "node(id: $repo_id) { ... on Repository { ") +
      spec.field + "(" + spec.args +
      ", first: $page_size, after: $cursor) { " + spec.selection + " } } } }";
  nlohmann::json variables{{"repo_id", repo.id},
                           {"page_size", kGraphQLPageSize},
                           {"cursor", nullptr}};
  std::vector<Event> events;
  bool done = false;
  while (!done) {
    nlohmann::json data;
    try {
      data = query(q, variables);
    } catch (const NotFoundError &e) {
      throw TransientFetchError("Repository " + repo.full_name() +
                                " disappeared: " + e.what());
    }
    try {
      const auto &node = data.at("node");
      if (node.is_null()) {
        throw TransientFetchError("Repository " + repo.full_name() +
                                  " disappeared");
      }
      const auto &conn = node.at(spec.field);
      for (const auto &entry : conn.at(spec.edges ? "edges" : "nodes")) {
        Timestamp order_key{};
        auto ev = parse_entry(repo, type, entry, order_key);
        if (!ev) {
          continue;
        }
        if (drafts != nullptr && drafts->count(ev->release_id) != 0) {
          found->insert(ev->release_id);
          events.push_back(std::move(*ev));
          if (order_key <= after && found->size() >= drafts->size()) {
            done = true;
            break;
          }
          continue;
        }
        if (order_key <= after) {
          // Older entries are only scanned for drafts not yet found.
          if (drafts == nullptr || found->size() >= drafts->size()) {
            done = true;
            break;
          }
          continue;
        }
        if (ev->timestamp > after) {
          events.push_back(std::move(*ev));
        }
      }
      const auto &page = conn.at("pageInfo");
      if (!page.at("hasNextPage").get<bool>()) {
        done = true;
      }
      variables["cursor"] = page.at("endCursor");
    } catch (const nlohmann::json::exception &e) {
      throw FatalFetchError("Unexpected " +
                            std::string(activity_type_name(type)) +
                            " response for " + repo.full_name() + ": " +
                            e.what());
    } catch (const std::invalid_argument &e) {
      throw FatalFetchError("Bad timestamp in " +
                            std::string(activity_type_name(type)) +
                            " response for " + repo.full_name() + ": " +
                            e.what());
    }
  }
  std::reverse(events.begin(), events.end());
  github_log()->debug("Fetched {} {} event(s) for {}", events.size(),
                      activity_type_name(type), repo.full_name());
  return events;
}

} // namespace ghd
