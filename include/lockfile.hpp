#ifndef GHDIGEST_LOCKFILE_HPP
#define GHDIGEST_LOCKFILE_HPP

#include <filesystem>
#include <string>

namespace ghd {

/**
 * RAII lock directory that keeps two runs from sharing a state file.
 *
 * The directory holds a `pid` file naming the owner. It is filled in under a
 * private name and renamed into place, so a visible lock always names its
 * owner. A lock left behind by a process that no longer exists is reclaimed.
 */
class LockFile {
public:
  /// Try to take the lock at @p dir. Check acquired() afterwards.
  explicit LockFile(const std::filesystem::path &dir);
  ~LockFile();

  LockFile(const LockFile &) = delete;
  LockFile &operator=(const LockFile &) = delete;

  bool acquired() const { return locked_; }
  const std::string &error() const { return err_; }
  const std::filesystem::path &path() const { return lock_dir_; }

  /// Lock directory used for @p state_file (`<state_file>.lock`).
  static std::filesystem::path for_state_file(const std::string &state_file);

private:
  std::filesystem::path lock_dir_;
  bool locked_{false};
  std::string err_;
};

} // namespace ghd

#endif // GHDIGEST_LOCKFILE_HPP
