#include "activity_policy.hpp"
#include "errors.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace ghd {

namespace {

constexpr std::array<const char *, kPolicyKeyCount> kKeyNames = {
    "issues",      "pull-requests", "discussions",   "releases",
    "tags",        "stars",         "forks",         "prereleases",
    "drafts",      "released-tags", "my-activity"};

const RepoPolicyEntry *find_entry(const PolicyConfig &config,
                                  const RepoRef &repo, bool wildcard) {
  for (const auto &entry : config.repos) {
    if (entry.pattern.is_wildcard() == wildcard &&
        entry.pattern.matches(repo)) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace

const char *policy_key_name(PolicyKey key) {
  return kKeyNames[static_cast<std::size_t>(key)];
}

std::optional<PolicyKey> parse_policy_key(const std::string &name) {
  std::string normalized = name;
  std::replace(normalized.begin(), normalized.end(), '_', '-');
  for (std::size_t i = 0; i < kKeyNames.size(); ++i) {
    if (normalized == kKeyNames[i]) {
      return static_cast<PolicyKey>(i);
    }
  }
  return std::nullopt;
}

bool PolicyLayer::empty() const {
  return std::none_of(values_.begin(), values_.end(),
                      [](const std::optional<bool> &v) { return v.has_value(); });
}

PolicyLayer PolicyLayer::from_json(const nlohmann::json &table,
                                   const std::string &context,
                                   std::optional<bool> *include) {
  if (!table.is_object()) {
    throw ConfigError(context + " must be a table");
  }
  PolicyLayer layer;
  for (const auto &[name, value] : table.items()) {
    if (include != nullptr && name == "include") {
      if (!value.is_boolean()) {
        throw ConfigError(context + ".include must be a boolean");
      }
      *include = value.get<bool>();
      continue;
    }
    auto key = parse_policy_key(name);
    if (!key) {
      throw ConfigError("Unknown key '" + name + "' in " + context);
    }
    if (!value.is_boolean()) {
      throw ConfigError(context + "." + name + " must be a boolean");
    }
    layer.set(*key, value.get<bool>());
  }
  return layer;
}

ActivityPolicy::ActivityPolicy() {
  for (std::size_t i = 0; i < kPolicyKeyCount; ++i) {
    values_[i] = default_value(static_cast<PolicyKey>(i));
  }
}

bool ActivityPolicy::default_value(PolicyKey key) {
  return key != PolicyKey::ReleasedTags && key != PolicyKey::MyActivity;
}

std::vector<ActivityType> ActivityPolicy::tracked_types() const {
  std::vector<ActivityType> types;
  for (ActivityType type : kAllActivityTypes) {
    if (tracks(type)) {
      types.push_back(type);
    }
  }
  return types;
}

ActivityPolicy policy_for(const RepoRef &repo, bool is_affiliated,
                          const PolicyConfig &config) {
  std::vector<const PolicyLayer *> layers;
  if (const auto *exact = find_entry(config, repo, false)) {
    layers.push_back(&exact->layer);
  }
  if (const auto *owner = find_entry(config, repo, true)) {
    layers.push_back(&owner->layer);
  }
  if (is_affiliated) {
    layers.push_back(&config.affiliated);
  }
  layers.push_back(&config.global);

  ActivityPolicy policy;
  for (std::size_t i = 0; i < kPolicyKeyCount; ++i) {
    auto key = static_cast<PolicyKey>(i);
    for (const PolicyLayer *layer : layers) {
      if (auto value = layer->get(key)) {
        policy.set(key, *value);
        break;
      }
    }
  }
  return policy;
}

std::vector<RepoPattern> implicit_includes(const PolicyConfig &config) {
  std::vector<RepoPattern> patterns;
  for (const auto &entry : config.repos) {
    if (entry.include) {
      patterns.push_back(entry.pattern);
    }
  }
  return patterns;
}

nlohmann::json policy_to_json(const ActivityPolicy &policy) {
  nlohmann::json j = nlohmann::json::object();
  for (std::size_t i = 0; i < kPolicyKeyCount; ++i) {
    j[kKeyNames[i]] = policy.get(static_cast<PolicyKey>(i));
  }
  return j;
}

} // namespace ghd
