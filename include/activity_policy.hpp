/**
 * @file activity_policy.hpp
 * @brief Per-repository activity policy and its precedence resolution.
 *
 * A policy is assembled from up to four partial layers. For each key the
 * first layer that sets it wins, in the order exact repository entry,
 * owner wildcard entry, affiliated default (affiliated repositories only),
 * global default. Keys no layer sets fall back to built-in defaults.
 */
#ifndef GHDIGEST_ACTIVITY_POLICY_HPP
#define GHDIGEST_ACTIVITY_POLICY_HPP

#include "activity.hpp"
#include "repo_pattern.hpp"

#include <array>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ghd {

/**
 * Keys of an activity policy. The first seven correspond one to one with
 * ActivityType.
 */
enum class PolicyKey {
  Issues,
  PullRequests,
  Discussions,
  Releases,
  Tags,
  Stars,
  Forks,
  Prereleases,
  Drafts,
  ReleasedTags,
  MyActivity
};

constexpr std::size_t kPolicyKeyCount = 11;

/// Configuration name of @p key using dashes (`pull-requests`).
const char *policy_key_name(PolicyKey key);

/**
 * Parse a configuration key. Dashes and underscores are interchangeable.
 *
 * @return The key, or `std::nullopt` when the name is not a policy key.
 */
std::optional<PolicyKey> parse_policy_key(const std::string &name);

/// Policy key enabling an activity type.
constexpr PolicyKey policy_key_for(ActivityType type) {
  return static_cast<PolicyKey>(activity_index(type));
}

/// Partial policy: each key is either set or left to lower layers.
class PolicyLayer {
public:
  std::optional<bool> get(PolicyKey key) const {
    return values_[static_cast<std::size_t>(key)];
  }

  void set(PolicyKey key, bool value) {
    values_[static_cast<std::size_t>(key)] = value;
  }

  /// Whether no key is set.
  bool empty() const;

  /**
   * Build a layer from a configuration table of booleans.
   *
   * @param table JSON object mapping key names to booleans.
   * @param context Description used in error messages.
   * @param include Receives the `include` key when non-null; the key is
   *        rejected when null.
   * @throws ConfigError On unknown keys or non-boolean values.
   */
  static PolicyLayer from_json(const nlohmann::json &table,
                               const std::string &context,
                               std::optional<bool> *include = nullptr);

private:
  std::array<std::optional<bool>, kPolicyKeyCount> values_{};
};

/// Fully resolved policy for one repository.
class ActivityPolicy {
public:
  /// Policy holding the built-in defaults.
  ActivityPolicy();

  bool get(PolicyKey key) const { return values_[static_cast<std::size_t>(key)]; }
  void set(PolicyKey key, bool value) {
    values_[static_cast<std::size_t>(key)] = value;
  }

  /// Whether activity of @p type is tracked.
  bool tracks(ActivityType type) const { return get(policy_key_for(type)); }

  /// Enabled activity types in ActivityType order.
  std::vector<ActivityType> tracked_types() const;

  /// Whether at least one activity type is enabled.
  bool tracks_anything() const { return !tracked_types().empty(); }

  /// Default value of @p key when no layer sets it.
  static bool default_value(PolicyKey key);

  bool operator==(const ActivityPolicy &other) const {
    return values_ == other.values_;
  }

private:
  std::array<bool, kPolicyKeyCount> values_{};
};

/// Exact-repository or owner-wildcard entry of the policy table.
struct RepoPolicyEntry {
  RepoPattern pattern;
  PolicyLayer layer;
  bool include{true}; ///< Whether the pattern implicitly selects repositories
};

/// Complete policy configuration.
struct PolicyConfig {
  PolicyLayer global;
  PolicyLayer affiliated;
  std::vector<RepoPolicyEntry> repos;
};

/**
 * Resolve the policy for a repository.
 *
 * @param repo Repository being resolved.
 * @param is_affiliated Whether the repository came from the affiliated
 *        listing.
 * @param config Policy layers.
 * @return Policy with every key resolved.
 */
ActivityPolicy policy_for(const RepoRef &repo, bool is_affiliated,
                          const PolicyConfig &config);

/// Patterns keyed in the policy table that implicitly include repositories.
std::vector<RepoPattern> implicit_includes(const PolicyConfig &config);

/// JSON object mapping every policy key name to its resolved value.
nlohmann::json policy_to_json(const ActivityPolicy &policy);

} // namespace ghd

#endif // GHDIGEST_ACTIVITY_POLICY_HPP
