#include "repo_pattern.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace ghd {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// GitHub logins: alphanumerics and single inner hyphens, at most 39 chars.
bool valid_login(const std::string &login) {
  if (login.empty() || login.size() > 39)
    return false;
  if (login.front() == '-' || login.back() == '-')
    return false;
  char prev = '\0';
  for (char c : login) {
    bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-';
    if (!ok || (c == '-' && prev == '-'))
      return false;
    prev = c;
  }
  return true;
}

bool valid_repo_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..")
    return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
  });
}

} // namespace

RepoPattern RepoPattern::parse(const std::string &text) {
  auto slash = text.find('/');
  if (slash == std::string::npos || text.find('/', slash + 1) != std::string::npos) {
    throw ConfigError("Invalid repository pattern '" + text +
                      "': expected owner/name or owner/*");
  }
  std::string owner = text.substr(0, slash);
  std::string name = text.substr(slash + 1);
  if (!valid_login(owner)) {
    throw ConfigError("Invalid repository owner in pattern '" + text + "'");
  }
  if (name == "*") {
    return wildcard(std::move(owner));
  }
  if (!valid_repo_name(name)) {
    throw ConfigError("Invalid repository name in pattern '" + text + "'");
  }
  return exact(std::move(owner), std::move(name));
}

RepoPattern RepoPattern::wildcard(std::string owner) {
  RepoPattern p;
  p.owner_ = std::move(owner);
  return p;
}

RepoPattern RepoPattern::exact(std::string owner, std::string name) {
  RepoPattern p;
  p.owner_ = std::move(owner);
  p.name_ = std::move(name);
  return p;
}

bool RepoPattern::matches(const std::string &owner,
                          const std::string &name) const {
  if (to_lower_copy(owner) != to_lower_copy(owner_))
    return false;
  return !name_ || to_lower_copy(*name_) == to_lower_copy(name);
}

std::string RepoPattern::to_string() const {
  return owner_ + "/" + (name_ ? *name_ : std::string("*"));
}

bool RepoPattern::operator==(const RepoPattern &other) const {
  if (to_lower_copy(owner_) != to_lower_copy(other.owner_))
    return false;
  if (name_.has_value() != other.name_.has_value())
    return false;
  return !name_ || to_lower_copy(*name_) == to_lower_copy(*other.name_);
}

} // namespace ghd
