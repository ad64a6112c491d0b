#include "tracking_state.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace ghd {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> state_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("state");
  }();
  return logger;
}

const nlohmann::json &require_field(const nlohmann::json &record,
                                    const std::string &id, const char *field) {
  auto it = record.find(field);
  if (it == record.end()) {
    throw StateCorruptionError("State record " + id + " is missing '" + field +
                               "'");
  }
  return *it;
}

std::string require_string(const nlohmann::json &record, const std::string &id,
                           const char *field) {
  const auto &value = require_field(record, id, field);
  if (!value.is_string()) {
    throw StateCorruptionError("State record " + id + ": '" + field +
                               "' must be a string");
  }
  return value.get<std::string>();
}

} // namespace

nlohmann::json state_to_json(const TrackingState &state) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[id, record] : state) {
    nlohmann::json cutoffs = nlohmann::json::object();
    for (const auto &[type, ts] : record.cutoffs) {
      cutoffs[activity_type_name(type)] = format_timestamp(ts);
    }
    j[id] = {{"owner", record.owner},
             {"name", record.name},
             {"cutoffs", cutoffs},
             {"seenDraftReleaseIds", record.seen_draft_release_ids}};
  }
  return j;
}

TrackingState state_from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw StateCorruptionError("State document must be a JSON object");
  }
  TrackingState state;
  for (const auto &[id, record] : j.items()) {
    if (!record.is_object()) {
      throw StateCorruptionError("State record " + id + " must be an object");
    }
    RepoState rs;
    rs.owner = require_string(record, id, "owner");
    rs.name = require_string(record, id, "name");
    const auto &cutoffs = require_field(record, id, "cutoffs");
    if (!cutoffs.is_object()) {
      throw StateCorruptionError("State record " + id +
                                 ": 'cutoffs' must be an object");
    }
    for (const auto &[type_name, value] : cutoffs.items()) {
      auto type = parse_activity_type(type_name);
      if (!type) {
        throw StateCorruptionError("State record " + id +
                                   ": unknown activity type '" + type_name +
                                   "'");
      }
      if (!value.is_string()) {
        throw StateCorruptionError("State record " + id + ": cutoff for " +
                                   type_name + " must be a string");
      }
      try {
        rs.cutoffs[*type] = parse_timestamp(value.get<std::string>());
      } catch (const std::invalid_argument &e) {
        throw StateCorruptionError("State record " + id + ": " + e.what());
      }
    }
    auto drafts = record.find("seenDraftReleaseIds");
    if (drafts != record.end()) {
      if (!drafts->is_array()) {
        throw StateCorruptionError("State record " + id +
                                   ": 'seenDraftReleaseIds' must be an array");
      }
      for (const auto &rid : *drafts) {
        if (!rid.is_string()) {
          throw StateCorruptionError("State record " + id +
                                     ": release ids must be strings");
        }
        rs.seen_draft_release_ids.insert(rid.get<std::string>());
      }
    }
    state.emplace(id, std::move(rs));
  }
  return state;
}

TrackingState load_state(const std::string &path) {
  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    state_log()->info("State file {} not found; treating as empty", path);
    return {};
  }
  if (ec) {
    state_log()->error("Cannot access state file {}: {}", path, ec.message());
    throw StateCorruptionError("Cannot access state file " + path + ": " +
                               ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    state_log()->error("Failed to open state file {}", path);
    throw StateCorruptionError("Failed to open state file " + path);
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception &e) {
    state_log()->error("Failed to parse state file {}: {}", path, e.what());
    throw StateCorruptionError("Failed to parse state file " + path + ": " +
                               e.what());
  }
  auto state = state_from_json(j);
  state_log()->debug("Loaded state for {} repositories from {}", state.size(),
                     path);
  return state;
}

void save_state(const std::string &path, const TrackingState &state) {
  fs::path final_path(path);
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path temp_path = final_path;
  temp_path += "." + std::to_string(stamp) + ".tmp";

  if (final_path.has_parent_path()) {
    fs::create_directories(final_path.parent_path());
  }
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      state_log()->error("Failed to open temporary state file {}",
                         temp_path.string());
      throw std::runtime_error("Failed to open " + temp_path.string());
    }
    out << state_to_json(state).dump(2) << '\n';
    out.flush();
    if (!out) {
      std::error_code ec;
      fs::remove(temp_path, ec);
      state_log()->error("Failed to write temporary state file {}",
                         temp_path.string());
      throw std::runtime_error("Failed to write " + temp_path.string());
    }
  }
  std::error_code ec;
  fs::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(temp_path, cleanup);
    state_log()->error("Failed to replace state file {}: {}", path,
                       ec.message());
    throw std::runtime_error("Failed to replace " + path + ": " + ec.message());
  }
  state_log()->info("Saved state for {} repositories to {}", state.size(),
                    path);
}

} // namespace ghd
