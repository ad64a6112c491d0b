/**
 * @file github_source.hpp
 * @brief GitHub GraphQL implementation of ActivitySource.
 */
#ifndef GHDIGEST_GITHUB_SOURCE_HPP
#define GHDIGEST_GITHUB_SOURCE_HPP

#include "activity_source.hpp"
#include "http_client.hpp"
#include "retry.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ghd {

/// Number of nodes requested per GraphQL page.
constexpr int kGraphQLPageSize = 50;

/**
 * GitHub GraphQL API client providing repository listings and activity.
 *
 * Requests are retried according to the configured RetryPolicy. Failures
 * that survive the retries surface as TransientFetchError, while client
 * errors and GraphQL errors surface as FatalFetchError (or NotFoundError for
 * missing owners and repositories).
 */
class GitHubGraphQLClient : public ActivitySource {
public:
  /**
   * Construct a client.
   *
   * @param token Personal access token sent as a bearer token.
   * @param http HTTP transport. A CurlHttpClient is created when null.
   * @param api_url GraphQL endpoint.
   * @param retry Retry schedule for each request.
   */
  GitHubGraphQLClient(std::string token, std::unique_ptr<HttpClient> http,
                      std::string api_url = "https://api.github.com/graphql",
                      RetryPolicy retry = RetryPolicy{});

  std::vector<RepoRef> list_affiliated_repositories(
      const std::vector<Affiliation> &affiliations) override;

  std::vector<RepoRef>
  list_repositories_under_owner(const std::string &owner) override;

  RepoRef get_repository(const std::string &owner,
                         const std::string &name) override;

  std::vector<Event> list_events(const RepoRef &repo, ActivityType type,
                                 Timestamp after) override;

  /**
   * Releases newer than @p after plus every release in @p drafts. Paging
   * goes past the cutoff until all of @p drafts are found or the listing
   * ends.
   */
  std::vector<Event> list_releases(const RepoRef &repo, Timestamp after,
                                   const std::set<std::string> &drafts,
                                   std::set<std::string> &gone) override;

  /**
   * Execute a GraphQL query and return its `data` member.
   *
   * @throws NotFoundError When GitHub reports a `NOT_FOUND` error.
   * @throws TransientFetchError When retries are exhausted.
   * @throws FatalFetchError On other failures.
   */
  nlohmann::json query(const std::string &query,
                       const nlohmann::json &variables);

  const std::string &api_url() const { return api_url_; }

private:
  nlohmann::json query_once(const std::string &payload);
  std::vector<Event> fetch_activity(const RepoRef &repo, ActivityType type,
                                    Timestamp after,
                                    const std::set<std::string> *drafts,
                                    std::set<std::string> *found);
  std::vector<RepoRef> list_repositories(const std::string &query,
                                         nlohmann::json variables,
                                         const std::vector<std::string> &path,
                                         const std::string &owner);

  std::string token_;
  std::unique_ptr<HttpClient> http_;
  std::string api_url_;
  RetryPolicy retry_;
};

} // namespace ghd

#endif // GHDIGEST_GITHUB_SOURCE_HPP
