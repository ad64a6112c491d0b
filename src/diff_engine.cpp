#include "diff_engine.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_set>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> diff_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("diff");
  }();
  return logger;
}

/// Result slot written by exactly one fetch task.
struct FetchSlot {
  std::size_t repo_index{0};
  ActivityType type{ActivityType::Issue};
  Timestamp after{};
  std::set<std::string> drafts; ///< Pending draft ids (releases only)
  std::vector<Event> events;
  std::set<std::string> gone;
  std::exception_ptr error;
  bool transient{false};
};

std::string describe(const Event &ev) {
  switch (ev.type) {
  case ActivityType::Release:
    return "release " + ev.tag_name;
  case ActivityType::Tag:
    return "tag " + ev.name;
  case ActivityType::Star:
    return "star by @" + ev.author;
  case ActivityType::Fork:
    return "fork by @" + ev.author;
  default:
    return std::string(activity_type_name(ev.type)) + " #" +
           std::to_string(ev.number);
  }
}

/// Outcome of the release rules for one fetched release.
enum class ReleaseFate { Report, DraftSuppressed, Dropped };

ReleaseFate release_fate(const Event &ev, const ActivityPolicy &policy,
                         std::set<std::string> &seen_drafts) {
  if (ev.draft) {
    if (!seen_drafts.insert(ev.release_id).second) {
      diff_log()->info("<{}> on {} is a draft already seen; not reporting",
                       describe(ev), ev.repo.full_name());
      return ReleaseFate::DraftSuppressed;
    }
    if (!policy.get(PolicyKey::Drafts)) {
      diff_log()->info("<{}> on {} is a draft release; not reporting",
                       describe(ev), ev.repo.full_name());
      return ReleaseFate::DraftSuppressed;
    }
  } else if (seen_drafts.erase(ev.release_id) != 0) {
    diff_log()->info("<{}> on {} was already seen as a draft; not reporting",
                     describe(ev), ev.repo.full_name());
    return ReleaseFate::DraftSuppressed;
  }
  if (ev.prerelease && !policy.get(PolicyKey::Prereleases)) {
    diff_log()->info("<{}> on {} is a prerelease; not reporting", describe(ev),
                     ev.repo.full_name());
    return ReleaseFate::Dropped;
  }
  return ReleaseFate::Report;
}

bool hidden_as_own_activity(const Event &ev, const ActivityPolicy &policy) {
  if (ev.author_is_viewer && !policy.get(PolicyKey::MyActivity)) {
    diff_log()->info("<{}> on {} was created by the current user; not "
                     "reporting",
                     describe(ev), ev.repo.full_name());
    return true;
  }
  return false;
}

/**
 * Apply reporting rules to the fetched events of one repository.
 *
 * Releases are decided first. A tag is hidden as a duplicate only when its
 * release was reported or suppressed by the draft rule.
 *
 * @param fetched Fetched events grouped in ActivityType order.
 * @param policy Resolved policy of the repository.
 * @param seen_drafts Draft release ids; updated in place.
 * @param out Receives the events to report.
 */
void filter_events(const std::vector<const Event *> &fetched,
                   const ActivityPolicy &policy,
                   std::set<std::string> &seen_drafts,
                   std::vector<Event> &out) {
  std::vector<bool> keep(fetched.size(), true);
  std::unordered_set<std::string> release_tags;
  for (std::size_t i = 0; i < fetched.size(); ++i) {
    const Event &ev = *fetched[i];
    if (ev.type != ActivityType::Release) {
      continue;
    }
    ReleaseFate fate = release_fate(ev, policy, seen_drafts);
    if (fate == ReleaseFate::Report && hidden_as_own_activity(ev, policy)) {
      fate = ReleaseFate::Dropped;
    }
    if (fate != ReleaseFate::Dropped && !ev.tag_name.empty()) {
      release_tags.insert(ev.tag_name);
    }
    keep[i] = fate == ReleaseFate::Report;
  }

  const bool hide_released_tags = policy.tracks(ActivityType::Release) &&
                                  policy.tracks(ActivityType::Tag) &&
                                  !policy.get(PolicyKey::ReleasedTags);
  for (std::size_t i = 0; i < fetched.size(); ++i) {
    const Event &ev = *fetched[i];
    if (ev.type == ActivityType::Release) {
      if (keep[i]) {
        out.push_back(ev);
      }
      continue;
    }
    if (ev.type == ActivityType::Tag && hide_released_tags &&
        release_tags.count(ev.name) != 0) {
      diff_log()->info("Tag {} on {} is also present as a release; not "
                       "reporting",
                       ev.name, ev.repo.full_name());
      continue;
    }
    if (hidden_as_own_activity(ev, policy)) {
      continue;
    }
    out.push_back(ev);
  }
}

} // namespace

DiffEngine::DiffEngine(ActivitySource &source, WorkerPool *pool)
    : source_(source), pool_(pool) {}

DiffResult DiffEngine::diff(const std::vector<PlannedRepository> &repos,
                            const TrackingState &previous, Timestamp now) {
  DiffResult result;

  // Repositories that remain tracked, in plan order.
  std::vector<const PlannedRepository *> active;
  std::unordered_set<std::string> active_ids;
  for (const auto &planned : repos) {
    if (!planned.policy.tracks_anything()) {
      diff_log()->info("No tracked activity configured for {}",
                       planned.repo.full_name());
      continue;
    }
    if (!active_ids.insert(planned.repo.id).second) {
      continue;
    }
    active.push_back(&planned);
  }

  std::vector<FetchSlot> slots;
  for (std::size_t i = 0; i < active.size(); ++i) {
    const PlannedRepository &planned = *active[i];
    const RepoRef &repo = planned.repo;
    auto prev = previous.find(repo.id);
    RepoState next;
    next.owner = repo.owner;
    next.name = repo.name;

    if (prev == previous.end()) {
      diff_log()->info("Now tracking {}", repo.full_name());
      result.notices.push_back(
          {LifecycleNotice::Kind::NewlyTracked, repo, {}, {}, now});
      for (ActivityType type : planned.policy.tracked_types()) {
        next.cutoffs[type] = now;
      }
      result.next_state[repo.id] = std::move(next);
      continue;
    }

    const RepoState &old = prev->second;
    if (old.owner != repo.owner || old.name != repo.name) {
      diff_log()->info("Repository renamed: {}/{} -> {}", old.owner, old.name,
                       repo.full_name());
      result.notices.push_back({LifecycleNotice::Kind::Renamed, repo,
                                old.owner, old.name, now});
    }
    next.seen_draft_release_ids = old.seen_draft_release_ids;
    for (ActivityType type : planned.policy.tracked_types()) {
      auto cutoff = old.cutoffs.find(type);
      if (cutoff == old.cutoffs.end()) {
        diff_log()->debug("Starting {} tracking for {}",
                          activity_type_name(type), repo.full_name());
        next.cutoffs[type] = now;
        continue;
      }
      next.cutoffs[type] = cutoff->second;
      FetchSlot slot;
      slot.repo_index = i;
      slot.type = type;
      slot.after = cutoff->second;
      if (type == ActivityType::Release) {
        slot.drafts = old.seen_draft_release_ids;
      }
      slots.push_back(std::move(slot));
    }
    result.next_state[repo.id] = std::move(next);
  }

  std::vector<std::future<void>> pending;
  pending.reserve(slots.size());
  for (auto &slot : slots) {
    const RepoRef &repo = active[slot.repo_index]->repo;
    std::string name =
        repo.full_name() + ":" + activity_type_name(slot.type);
    FetchSlot *target = &slot;
    auto job = [this, target, &repo]() {
      try {
        if (target->type == ActivityType::Release) {
          target->events = source_.list_releases(repo, target->after,
                                                 target->drafts, target->gone);
        } else {
          target->events =
              source_.list_events(repo, target->type, target->after);
        }
      } catch (const TransientFetchError &) {
        target->transient = true;
        target->error = std::current_exception();
      } catch (const std::exception &) {
        target->error = std::current_exception();
      }
    };
    if (pool_ != nullptr) {
      pending.push_back(pool_->submit(std::move(name), std::move(job)));
    } else {
      job();
    }
  }
  for (auto &fut : pending) {
    fut.get();
  }

  for (const auto &slot : slots) {
    if (slot.error && !slot.transient) {
      std::rethrow_exception(slot.error);
    }
  }

  // Merge in (repository, type) order.
  std::size_t cursor = 0;
  for (std::size_t i = 0; i < active.size(); ++i) {
    const PlannedRepository &planned = *active[i];
    auto state_it = result.next_state.find(planned.repo.id);
    std::vector<const Event *> fetched;
    for (; cursor < slots.size() && slots[cursor].repo_index == i; ++cursor) {
      const FetchSlot &slot = slots[cursor];
      if (slot.transient) {
        try {
          std::rethrow_exception(slot.error);
        } catch (const TransientFetchError &e) {
          diff_log()->warn("Skipping {} activity for {} this run: {}",
                           activity_type_name(slot.type),
                           planned.repo.full_name(), e.what());
        }
        continue;
      }
      auto &seen = state_it->second.seen_draft_release_ids;
      for (const auto &id : slot.gone) {
        diff_log()->debug("Draft release {} on {} no longer exists", id,
                          planned.repo.full_name());
        seen.erase(id);
      }
      for (const auto &ev : slot.events) {
        if (ev.timestamp <= slot.after &&
            slot.drafts.count(ev.release_id) == 0) {
          continue;
        }
        auto &cutoff = state_it->second.cutoffs[slot.type];
        cutoff = std::max(cutoff, ev.timestamp);
        fetched.push_back(&ev);
      }
      diff_log()->debug("Fetched {} new {} event(s) for {}", slot.events.size(),
                        activity_type_name(slot.type),
                        planned.repo.full_name());
    }
    filter_events(fetched, planned.policy,
                  state_it->second.seen_draft_release_ids, result.events);
  }

  for (const auto &[id, old] : previous) {
    if (active_ids.count(id) != 0) {
      continue;
    }
    diff_log()->info("No longer tracking {}/{}", old.owner, old.name);
    RepoRef repo{id, old.owner, old.name};
    result.notices.push_back(
        {LifecycleNotice::Kind::NoLongerTracked, repo, {}, {}, now});
  }

  diff_log()->info("Diff produced {} event(s) and {} notice(s)",
                   result.events.size(), result.notices.size());
  return result;
}

} // namespace ghd
