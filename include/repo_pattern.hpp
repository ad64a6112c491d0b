/**
 * @file repo_pattern.hpp
 * @brief Repository references and `owner/name` / `owner/*` patterns.
 */
#ifndef GHDIGEST_REPO_PATTERN_HPP
#define GHDIGEST_REPO_PATTERN_HPP

#include <optional>
#include <string>

namespace ghd {

/// Concrete repository as reported by GitHub.
struct RepoRef {
  std::string id;            ///< Opaque node id, stable across renames
  std::string owner;         ///< Owner login at the time of the fetch
  std::string name;          ///< Repository name at the time of the fetch
  std::string url{};         ///< Web URL of the repository
  std::string description{}; ///< Repository description (may be empty)

  /// `owner/name` form.
  std::string full_name() const { return owner + "/" + name; }
};

/**
 * Pattern selecting either a single repository (`owner/name`) or every
 * repository of an owner (`owner/*`).
 */
class RepoPattern {
public:
  RepoPattern() = default;

  /**
   * Parse a pattern string.
   *
   * @param text Pattern in `owner/name` or `owner/*` form.
   * @return Parsed pattern.
   * @throws ConfigError When the text is not a valid pattern.
   */
  static RepoPattern parse(const std::string &text);

  /// Construct a wildcard pattern for @p owner.
  static RepoPattern wildcard(std::string owner);

  /// Construct an exact pattern for @p owner / @p name.
  static RepoPattern exact(std::string owner, std::string name);

  /// Owner login part.
  const std::string &owner() const { return owner_; }

  /// Repository name for exact patterns.
  const std::optional<std::string> &name() const { return name_; }

  /// Whether this is an `owner/*` pattern.
  bool is_wildcard() const { return !name_.has_value(); }

  /**
   * Check whether a repository matches the pattern. Logins and names are
   * compared case-insensitively as GitHub does.
   */
  bool matches(const std::string &owner, const std::string &name) const;

  /// Convenience overload for a repository reference.
  bool matches(const RepoRef &repo) const {
    return matches(repo.owner, repo.name);
  }

  /// Render back to `owner/name` or `owner/*`.
  std::string to_string() const;

  bool operator==(const RepoPattern &other) const;
  bool operator!=(const RepoPattern &other) const { return !(*this == other); }

private:
  std::string owner_;
  std::optional<std::string> name_;
};

} // namespace ghd

#endif // GHDIGEST_REPO_PATTERN_HPP
