/**
 * @file activity.hpp
 * @brief Activity types, events and lifecycle notices making up a report.
 */
#ifndef GHDIGEST_ACTIVITY_HPP
#define GHDIGEST_ACTIVITY_HPP

#include "repo_pattern.hpp"
#include "util/time.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ghd {

/// Kinds of repository activity that can be tracked.
enum class ActivityType {
  Issue,
  PullRequest,
  Discussion,
  Release,
  Tag,
  Star,
  Fork
};

/// Number of ActivityType enumerators.
constexpr std::size_t kActivityTypeCount = 7;

/// Every activity type in declaration order.
constexpr std::array<ActivityType, kActivityTypeCount> kAllActivityTypes = {
    ActivityType::Issue,   ActivityType::PullRequest, ActivityType::Discussion,
    ActivityType::Release, ActivityType::Tag,         ActivityType::Star,
    ActivityType::Fork};

/// Stable wire name (`issue`, `pr`, `discussion`, ...).
const char *activity_type_name(ActivityType type);

/// Reverse of activity_type_name(); `std::nullopt` for unknown names.
std::optional<ActivityType> parse_activity_type(const std::string &name);

/// Index of @p type into arrays sized kActivityTypeCount.
constexpr std::size_t activity_index(ActivityType type) {
  return static_cast<std::size_t>(type);
}

/**
 * Single piece of new activity on a repository.
 *
 * Type-specific fields are left empty when they do not apply to the event's
 * type.
 */
struct Event {
  ActivityType type{ActivityType::Issue};
  RepoRef repo;
  Timestamp timestamp{};
  std::string author{};          ///< Login of the actor, empty when unknown
  bool author_is_viewer{false}; ///< Actor is the authenticated user
  std::string title{};          ///< Issue/PR/discussion title
  std::string body{};           ///< Release description excerpt
  std::string url{};
  int number{0}; ///< Issue/PR/discussion number

  // Releases
  std::string release_id{};
  std::string tag_name{};
  bool prerelease{false};
  bool draft{false};

  std::string name{};     ///< Release name or tag name
  std::string fork_url{}; ///< URL of the newly created fork
};

/// Repository lifecycle change detected by the diff engine.
struct LifecycleNotice {
  enum class Kind { NewlyTracked, NoLongerTracked, Renamed };

  Kind kind{Kind::NewlyTracked};
  RepoRef repo;             ///< Current repository (last known for NoLongerTracked)
  std::string old_owner{};  ///< Previous owner for Renamed
  std::string old_name{};   ///< Previous name for Renamed
  Timestamp timestamp{};    ///< Moment of detection
};

/// Entry of the final report.
using ReportItem = std::variant<Event, LifecycleNotice>;

/// Timestamp of either alternative.
Timestamp item_timestamp(const ReportItem &item);

} // namespace ghd

#endif // GHDIGEST_ACTIVITY_HPP
