#include "lockfile.hpp"
#include "log.hpp"

#include <cerrno>
#include <fstream>
#include <signal.h>
#include <system_error>
#include <unistd.h>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> state_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("state");
  }();
  return logger;
}

bool process_running(long pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(static_cast<pid_t>(pid), 0) == 0 || errno != ESRCH;
}

long read_pid(const std::filesystem::path &dir) {
  std::ifstream f(dir / "pid");
  long pid = 0;
  if (f) {
    f >> pid;
  }
  return pid;
}

/// Sibling of @p lock_dir private to this process.
std::filesystem::path private_sibling(const std::filesystem::path &lock_dir,
                                      const char *suffix) {
  return std::filesystem::path(lock_dir.string() + "." +
                               std::to_string(static_cast<long>(getpid())) +
                               suffix);
}

} // namespace

std::filesystem::path LockFile::for_state_file(const std::string &state_file) {
  return std::filesystem::path(state_file + ".lock");
}

LockFile::LockFile(const std::filesystem::path &dir) : lock_dir_(dir) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (lock_dir_.has_parent_path()) {
    fs::create_directories(lock_dir_.parent_path(), ec);
  }
  if (fs::exists(lock_dir_, ec)) {
    long pid = read_pid(lock_dir_);
    if (process_running(pid)) {
      err_ = "Another instance is already running (PID " +
             std::to_string(pid) + ")";
      return;
    }
    // Move the stale lock aside first so a lock installed meanwhile by
    // another run is never deleted.
    fs::path aside = private_sibling(lock_dir_, ".stale");
    fs::remove_all(aside, ec);
    fs::rename(lock_dir_, aside, ec);
    if (!ec) {
      long moved = read_pid(aside);
      if (moved != pid) {
        fs::rename(aside, lock_dir_, ec);
        err_ = "Another instance is already running (PID " +
               std::to_string(moved) + ")";
        return;
      }
      state_log()->warn("Removing stale lock {} (PID {})", lock_dir_.string(),
                        pid);
      fs::remove_all(aside, ec);
    }
  }

  // The lock becomes visible only once it names its owner.
  fs::path staging = private_sibling(lock_dir_, ".tmp");
  fs::remove_all(staging, ec);
  if (!fs::create_directory(staging, ec)) {
    err_ = "Failed to create lock directory " + staging.string();
    if (ec) {
      err_ += ": " + ec.message();
    }
    return;
  }
  {
    std::ofstream f(staging / "pid");
    f << static_cast<long>(getpid());
    f.close();
    if (!f) {
      fs::remove_all(staging, ec);
      err_ = "Failed to write " + (staging / "pid").string();
      return;
    }
  }
  fs::rename(staging, lock_dir_, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove_all(staging, cleanup);
    long pid = read_pid(lock_dir_);
    if (pid != 0) {
      err_ = "Another instance is already running (PID " +
             std::to_string(pid) + ")";
    } else {
      err_ = "Failed to create lock directory " + lock_dir_.string() + ": " +
             ec.message();
    }
    return;
  }
  locked_ = true;
  state_log()->debug("Acquired lock {}", lock_dir_.string());
}

LockFile::~LockFile() {
  if (locked_) {
    std::error_code ec;
    std::filesystem::remove_all(lock_dir_, ec);
  }
}

} // namespace ghd
