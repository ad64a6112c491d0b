/**
 * @file activity_source.hpp
 * @brief Interface for fetching repositories and their activity.
 */
#ifndef GHDIGEST_ACTIVITY_SOURCE_HPP
#define GHDIGEST_ACTIVITY_SOURCE_HPP

#include "activity.hpp"
#include "repo_pattern.hpp"
#include "util/time.hpp"

#include <set>
#include <string>
#include <vector>

namespace ghd {

/// Relationship of the authenticated user to a repository.
enum class Affiliation { Owner, OrganizationMember, Collaborator };

/// GraphQL enum value (`OWNER`, `ORGANIZATION_MEMBER`, `COLLABORATOR`).
const char *affiliation_name(Affiliation affiliation);

/**
 * Parse an affiliation token. Matching is case-insensitive and treats `-`
 * and `_` alike.
 *
 * @throws ConfigError For unknown tokens.
 */
Affiliation parse_affiliation(const std::string &token);

/// All affiliations; the default selection.
std::vector<Affiliation> all_affiliations();

/**
 * Source of repository listings and activity, normally the GitHub GraphQL
 * API. Implementations must be safe to call from several threads at once.
 */
class ActivitySource {
public:
  virtual ~ActivitySource() = default;

  /**
   * List repositories the authenticated user is affiliated with.
   *
   * @param affiliations Affiliation kinds to include.
   */
  virtual std::vector<RepoRef>
  list_affiliated_repositories(const std::vector<Affiliation> &affiliations) = 0;

  /**
   * List all repositories visible under @p owner.
   *
   * @throws NotFoundError When the owner does not exist.
   */
  virtual std::vector<RepoRef>
  list_repositories_under_owner(const std::string &owner) = 0;

  /**
   * Look up a single repository.
   *
   * @throws NotFoundError When the repository does not exist.
   */
  virtual RepoRef get_repository(const std::string &owner,
                                 const std::string &name) = 0;

  /**
   * Fetch activity of @p type on @p repo with timestamps strictly after
   * @p after, oldest first.
   *
   * @throws TransientFetchError When retries were exhausted.
   * @throws FatalFetchError On non-retryable failures.
   */
  virtual std::vector<Event> list_events(const RepoRef &repo, ActivityType type,
                                         Timestamp after) = 0;

  /**
   * Fetch releases like list_events() and also return the current form of
   * every release in @p drafts, however old it is.
   *
   * The default implementation only returns releases newer than @p after
   * and leaves @p gone empty.
   *
   * @param drafts Ids of draft releases reported earlier.
   * @param gone Receives the ids from @p drafts that no longer exist.
   */
  virtual std::vector<Event>
  list_releases(const RepoRef &repo, Timestamp after,
                const std::set<std::string> & /*drafts*/,
                std::set<std::string> & /*gone*/) {
    return list_events(repo, ActivityType::Release, after);
  }
};

} // namespace ghd

#endif // GHDIGEST_ACTIVITY_SOURCE_HPP
