/**
 * @file repo_set.hpp
 * @brief Resolution of the set of tracked repositories.
 */
#ifndef GHDIGEST_REPO_SET_HPP
#define GHDIGEST_REPO_SET_HPP

#include "activity_policy.hpp"
#include "activity_source.hpp"
#include "repo_pattern.hpp"

#include <vector>

namespace ghd {

/// Repository selection settings from the `repos` table.
struct RepoSelection {
  std::vector<Affiliation> affiliations = all_affiliations();
  std::vector<RepoPattern> include;
  std::vector<RepoPattern> exclude;
};

/// Repository chosen for tracking.
struct TrackedRepository {
  RepoRef repo;
  bool affiliated{false}; ///< Found through the affiliated listing
};

/**
 * Determine which repositories are tracked.
 *
 * Affiliated repositories are listed first, followed by every repository of
 * wildcard-included owners and then individually included repositories.
 * Patterns keyed in the policy table count as includes unless their entry
 * sets `include = false`. Repositories matching an exclude pattern are
 * dropped, and a repository reached through several paths appears once.
 * Owners or repositories that do not exist are logged and skipped.
 *
 * @param source Source used for listings.
 * @param selection Affiliations and include/exclude patterns.
 * @param policies Policy table contributing implicit includes.
 * @return Tracked repositories in discovery order.
 */
std::vector<TrackedRepository>
resolve_repositories(ActivitySource &source, const RepoSelection &selection,
                     const PolicyConfig &policies);

/// Whether @p repo matches any pattern in @p patterns.
bool matches_any(const std::vector<RepoPattern> &patterns, const RepoRef &repo);

} // namespace ghd

#endif // GHDIGEST_REPO_SET_HPP
