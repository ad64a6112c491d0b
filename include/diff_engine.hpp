/**
 * @file diff_engine.hpp
 * @brief Computes new activity and the next tracking state.
 */
#ifndef GHDIGEST_DIFF_ENGINE_HPP
#define GHDIGEST_DIFF_ENGINE_HPP

#include "activity.hpp"
#include "activity_policy.hpp"
#include "activity_source.hpp"
#include "tracking_state.hpp"
#include "worker_pool.hpp"

#include <vector>

namespace ghd {

/// Tracked repository together with its resolved policy.
struct PlannedRepository {
  RepoRef repo;
  ActivityPolicy policy;
};

/// Outcome of a diff run.
struct DiffResult {
  std::vector<Event> events;            ///< New events in production order
  std::vector<LifecycleNotice> notices; ///< Notices in detection order
  TrackingState next_state;             ///< State to persist on success
};

/**
 * Compares fetched activity against the previous tracking state.
 *
 * For each planned repository with at least one enabled activity type:
 *  - an unknown repository yields a NewlyTracked notice and gets fresh
 *    cutoffs at `now` without any fetch;
 *  - a known repository whose owner/name changed yields a Renamed notice
 *    and keeps its cutoffs;
 *  - each enabled type with a cutoff is fetched for events strictly after
 *    it, filtered, and its cutoff advanced to the newest fetched event;
 *  - an enabled type without a cutoff gets one at `now`, and disabled
 *    types lose theirs;
 *  - draft releases reported earlier are fetched again through
 *    ActivitySource::list_releases() until they are published or deleted.
 * Repositories in the previous state that are no longer planned yield a
 * NoLongerTracked notice and are dropped.
 *
 * Fetches run on the optional worker pool. A TransientFetchError skips the
 * affected repository/type pair and keeps its cutoff; any other error is
 * rethrown once all fetches have completed.
 */
class DiffEngine {
public:
  /**
   * @param source Source used to fetch activity.
   * @param pool Optional worker pool; fetches run inline when null.
   */
  explicit DiffEngine(ActivitySource &source, WorkerPool *pool = nullptr);

  /**
   * Run the diff.
   *
   * @param repos Planned repositories in resolution order.
   * @param previous State loaded at the start of the run.
   * @param now Detection time used for new cutoffs and notices.
   * @return New events, notices and the next state.
   */
  DiffResult diff(const std::vector<PlannedRepository> &repos,
                  const TrackingState &previous, Timestamp now);

private:
  ActivitySource &source_;
  WorkerPool *pool_;
};

} // namespace ghd

#endif // GHDIGEST_DIFF_ENGINE_HPP
