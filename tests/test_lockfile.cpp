#include "lockfile.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

using namespace ghd;
namespace fs = std::filesystem;

namespace {
fs::path lock_root(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

/// PID of a child that has already exited and been reaped.
long dead_pid() {
  pid_t child = fork();
  if (child == 0) {
    _exit(0);
  }
  int status = 0;
  waitpid(child, &status, 0);
  return static_cast<long>(child);
}
} // namespace

TEST_CASE("lock is placed beside the state file") {
  CHECK(LockFile::for_state_file("/var/lib/gd/state.json") ==
        fs::path("/var/lib/gd/state.json.lock"));
}

TEST_CASE("lock is acquired and released") {
  auto root = lock_root("ghdigest_lock_basic");
  auto dir = root / "state.json.lock";
  {
    LockFile lock(dir);
    REQUIRE(lock.acquired());
    CHECK(lock.error().empty());
    CHECK(fs::exists(dir / "pid"));
    std::ifstream f(dir / "pid");
    long pid = 0;
    f >> pid;
    CHECK(pid == static_cast<long>(getpid()));
  }
  CHECK_FALSE(fs::exists(dir));
  fs::remove_all(root);
}

TEST_CASE("a held lock blocks a second holder") {
  auto root = lock_root("ghdigest_lock_busy");
  auto dir = root / "state.json.lock";
  LockFile first(dir);
  REQUIRE(first.acquired());
  {
    LockFile second(dir);
    CHECK_FALSE(second.acquired());
    CHECK(second.error().find("already running") != std::string::npos);
  }
  CHECK(fs::exists(dir / "pid"));
  fs::remove_all(root);
}

TEST_CASE("a stale lock is reclaimed") {
  auto root = lock_root("ghdigest_lock_stale");
  auto dir = root / "state.json.lock";
  fs::create_directories(dir);
  std::ofstream(dir / "pid") << dead_pid();
  LockFile lock(dir);
  CHECK(lock.acquired());
  fs::remove_all(root);
}

TEST_CASE("a visible lock always names its owner") {
  auto root = lock_root("ghdigest_lock_staged");
  auto dir = root / "state.json.lock";
  LockFile lock(dir);
  REQUIRE(lock.acquired());
  std::vector<std::string> entries;
  for (const auto &entry : fs::directory_iterator(root)) {
    entries.push_back(entry.path().filename().string());
  }
  CHECK(entries == std::vector<std::string>{"state.json.lock"});

  LockFile second(dir);
  CHECK_FALSE(second.acquired());
  CHECK(second.error() == "Another instance is already running (PID " +
                              std::to_string(getpid()) + ")");
  CHECK(fs::exists(dir / "pid"));
  fs::remove_all(root);
}

TEST_CASE("a lock without an owner is reclaimed") {
  auto root = lock_root("ghdigest_lock_ownerless");
  auto dir = root / "state.json.lock";
  fs::create_directories(dir);
  {
    LockFile lock(dir);
    REQUIRE(lock.acquired());
    std::ifstream f(dir / "pid");
    long pid = 0;
    f >> pid;
    CHECK(pid == static_cast<long>(getpid()));
  }
  CHECK(fs::is_empty(root));
  fs::remove_all(root);
}
