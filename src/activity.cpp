#include "activity.hpp"

namespace ghd {

const char *activity_type_name(ActivityType type) {
  switch (type) {
  case ActivityType::Issue:
    return "issue";
  case ActivityType::PullRequest:
    return "pr";
  case ActivityType::Discussion:
    return "discussion";
  case ActivityType::Release:
    return "release";
  case ActivityType::Tag:
    return "tag";
  case ActivityType::Star:
    return "star";
  case ActivityType::Fork:
    return "fork";
  }
  return "unknown";
}

std::optional<ActivityType> parse_activity_type(const std::string &name) {
  for (ActivityType type : kAllActivityTypes) {
    if (name == activity_type_name(type)) {
      return type;
    }
  }
  return std::nullopt;
}

Timestamp item_timestamp(const ReportItem &item) {
  return std::visit([](const auto &value) { return value.timestamp; }, item);
}

} // namespace ghd
