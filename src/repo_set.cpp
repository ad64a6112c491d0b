#include "repo_set.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_set>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> repos_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repos");
  }();
  return logger;
}

std::string normalize_token(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return c == '-' ? '_' : static_cast<char>(std::toupper(c));
  });
  return value;
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

} // namespace

const char *affiliation_name(Affiliation affiliation) {
  switch (affiliation) {
  case Affiliation::Owner:
    return "OWNER";
  case Affiliation::OrganizationMember:
    return "ORGANIZATION_MEMBER";
  case Affiliation::Collaborator:
    return "COLLABORATOR";
  }
  return "OWNER";
}

Affiliation parse_affiliation(const std::string &token) {
  std::string normalized = normalize_token(token);
  for (Affiliation a : all_affiliations()) {
    if (normalized == affiliation_name(a)) {
      return a;
    }
  }
  throw ConfigError("Unknown repository affiliation '" + token +
                    "' (expected OWNER, ORGANIZATION_MEMBER or COLLABORATOR)");
}

std::vector<Affiliation> all_affiliations() {
  return {Affiliation::Owner, Affiliation::OrganizationMember,
          Affiliation::Collaborator};
}

bool matches_any(const std::vector<RepoPattern> &patterns,
                 const RepoRef &repo) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&repo](const RepoPattern &p) { return p.matches(repo); });
}

std::vector<TrackedRepository>
resolve_repositories(ActivitySource &source, const RepoSelection &selection,
                     const PolicyConfig &policies) {
  std::vector<RepoPattern> includes = selection.include;
  for (auto &pattern : implicit_includes(policies)) {
    includes.push_back(std::move(pattern));
  }

  std::vector<std::string> owners;
  std::unordered_set<std::string> owner_keys;
  for (const auto &pattern : includes) {
    if (pattern.is_wildcard() && owner_keys.insert(lower(pattern.owner())).second) {
      owners.push_back(pattern.owner());
    }
  }
  std::vector<RepoPattern> exact;
  for (const auto &pattern : includes) {
    if (pattern.is_wildcard() || owner_keys.count(lower(pattern.owner())) != 0) {
      continue;
    }
    if (std::find(exact.begin(), exact.end(), pattern) == exact.end()) {
      exact.push_back(pattern);
    }
  }

  std::vector<TrackedRepository> tracked;
  std::unordered_set<std::string> seen;
  auto consider = [&](RepoRef repo, bool affiliated) {
    if (matches_any(selection.exclude, repo)) {
      repos_log()->info("Repository {} is excluded by config; skipping",
                        repo.full_name());
      return;
    }
    if (!seen.insert(repo.id).second) {
      repos_log()->debug("Repository {} listed more than once", repo.full_name());
      return;
    }
    tracked.push_back({std::move(repo), affiliated});
  };

  if (!selection.affiliations.empty()) {
    for (auto &repo : source.list_affiliated_repositories(selection.affiliations)) {
      consider(std::move(repo), true);
    }
  }
  for (const auto &owner : owners) {
    try {
      for (auto &repo : source.list_repositories_under_owner(owner)) {
        consider(std::move(repo), false);
      }
    } catch (const NotFoundError &e) {
      repos_log()->warn("Repository owner {} does not exist: {}", owner,
                        e.what());
    }
  }
  for (const auto &pattern : exact) {
    const std::string &name = *pattern.name();
    if (matches_any(selection.exclude, RepoRef{"", pattern.owner(), name})) {
      repos_log()->info("Repository {} is excluded by config; skipping",
                        pattern.to_string());
      continue;
    }
    try {
      consider(source.get_repository(pattern.owner(), name), false);
    } catch (const NotFoundError &e) {
      repos_log()->warn("Repository {} does not exist: {}", pattern.to_string(),
                        e.what());
    }
  }
  repos_log()->info("Resolved {} tracked repositories", tracked.size());
  return tracked;
}

} // namespace ghd
