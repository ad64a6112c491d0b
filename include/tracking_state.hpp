/**
 * @file tracking_state.hpp
 * @brief Persisted per-repository tracking state.
 *
 * The state file is a JSON object keyed by repository id. Each record keeps
 * the last known `owner`/`name`, a `cutoffs` object mapping activity type
 * wire names to UTC timestamps and the `seenDraftReleaseIds` array.
 */
#ifndef GHDIGEST_TRACKING_STATE_HPP
#define GHDIGEST_TRACKING_STATE_HPP

#include "activity.hpp"
#include "util/time.hpp"

#include <map>
#include <nlohmann/json_fwd.hpp>
#include <set>
#include <string>

namespace ghd {

/// Stored record for one tracked repository.
struct RepoState {
  std::string owner;
  std::string name;
  std::map<ActivityType, Timestamp> cutoffs;
  std::set<std::string> seen_draft_release_ids;

  bool operator==(const RepoState &other) const {
    return owner == other.owner && name == other.name &&
           cutoffs == other.cutoffs &&
           seen_draft_release_ids == other.seen_draft_release_ids;
  }
};

/// Whole state keyed by repository id.
using TrackingState = std::map<std::string, RepoState>;

/// Serialize @p state to its JSON document form.
nlohmann::json state_to_json(const TrackingState &state);

/**
 * Parse a JSON state document.
 *
 * @throws StateCorruptionError When the document does not have the expected
 *         shape.
 */
TrackingState state_from_json(const nlohmann::json &j);

/**
 * Load the state file.
 *
 * @param path State file location.
 * @return Loaded state, or an empty state when the file does not exist.
 * @throws StateCorruptionError When the file exists but cannot be read or
 *         parsed.
 */
TrackingState load_state(const std::string &path);

/**
 * Atomically replace the state file.
 *
 * The document is written to a temporary file beside @p path which is then
 * renamed over it. Parent directories are created as needed.
 *
 * @throws std::runtime_error When writing or renaming fails.
 */
void save_state(const std::string &path, const TrackingState &state);

} // namespace ghd

#endif // GHDIGEST_TRACKING_STATE_HPP
