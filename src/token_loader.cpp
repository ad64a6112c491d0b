#include "token_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghd {

namespace {

std::string trim(const std::string &s) {
  auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string();
}

void from_yaml(const std::string &path, std::vector<std::string> &tokens) {
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsScalar()) {
    tokens.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto &item : node) {
      tokens.push_back(item.as<std::string>());
    }
  } else if (node.IsMap()) {
    if (node["token"]) {
      tokens.push_back(node["token"].as<std::string>());
    }
    if (const YAML::Node list = node["tokens"]) {
      if (!list.IsSequence()) {
        throw std::runtime_error("YAML tokens entry must be a sequence");
      }
      for (const auto &item : list) {
        tokens.push_back(item.as<std::string>());
      }
    }
  }
}

void from_json_file(const std::string &path, std::vector<std::string> &tokens) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  nlohmann::json j = nlohmann::json::parse(f);
  if (j.is_string()) {
    tokens.push_back(j.get<std::string>());
  } else if (j.is_array()) {
    for (const auto &item : j) {
      tokens.push_back(item.get<std::string>());
    }
  } else if (j.is_object()) {
    if (j.contains("token")) {
      tokens.push_back(j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      const auto &list = j["tokens"];
      if (!list.is_array()) {
        throw std::runtime_error("JSON tokens entry must be an array");
      }
      for (const auto &item : list) {
        tokens.push_back(item.get<std::string>());
      }
    }
  }
}

void from_toml(const std::string &path, std::vector<std::string> &tokens) {
  toml::table tbl = toml::parse_file(path);
  if (auto single = tbl["token"].value<std::string>()) {
    tokens.push_back(*single);
  }
  if (auto arr = tbl["tokens"].as_array()) {
    for (const auto &item : *arr) {
      auto value = item.value<std::string>();
      if (!value) {
        throw std::runtime_error("TOML tokens array must contain strings");
      }
      tokens.push_back(*value);
    }
  }
}

void from_text(const std::string &path, std::vector<std::string> &tokens) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  std::string line;
  while (std::getline(f, line)) {
    std::string token = trim(line);
    if (!token.empty()) {
      tokens.push_back(token);
    }
  }
}

} // namespace

std::vector<std::string> load_tokens_from_file(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  std::vector<std::string> tokens;
  if (ext == ".yaml" || ext == ".yml") {
    from_yaml(path, tokens);
  } else if (ext == ".json") {
    from_json_file(path, tokens);
  } else if (ext == ".toml" || ext == ".tml") {
    from_toml(path, tokens);
  } else {
    from_text(path, tokens);
  }
  tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                              [](const std::string &t) { return trim(t).empty(); }),
               tokens.end());
  std::transform(tokens.begin(), tokens.end(), tokens.begin(), trim);
  return tokens;
}

} // namespace ghd
