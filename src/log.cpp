#include "log.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLogger = "ghdigest";
constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_root;
std::mutex g_mutex;
std::once_flag g_pool_once;
bool g_file_attached = false;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(32768, 1); });
  return spdlog::thread_pool();
}

std::shared_ptr<spdlog::logger> make_async(const std::string &name,
                                           std::vector<spdlog::sink_ptr> sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}

/// `app.log` with index 2 becomes `app.2.log`; index 0 is the live file.
fs::path rotated_path(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  fs::path stem = base.stem();
  fs::path ext = base.extension();
  if (stem.empty()) {
    stem = base.filename();
    ext.clear();
  }
  fs::path name = stem;
  name += "." + std::to_string(index);
  name += ext;
  return base.parent_path() / name;
}

fs::path gz_path(const fs::path &p) {
  fs::path out = p;
  out += ".gz";
  return out;
}

/// Shift `<base>.N.gz` archives up by one, dropping the oldest.
void shift_archives(const fs::path &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(gz_path(rotated_path(base, keep)), ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = gz_path(rotated_path(base, i - 1));
    if (fs::exists(from, ec)) {
      fs::rename(from, gz_path(rotated_path(base, i)), ec);
    }
  }
}

/// Gzip @p source into `<source>.gz` and remove the original.
bool gzip_file(const fs::path &source) {
  auto log = ghd::category_logger("logging");
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    log->warn("Cannot open {} for compression", source.string());
    return false;
  }
  fs::path target = gz_path(source);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (gz == nullptr) {
    log->warn("Cannot create {}", target.string());
    return false;
  }
  std::vector<char> buffer(16 * 1024);
  bool ok = true;
  while (ok && in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if (got > 0 && gzwrite(gz, buffer.data(), static_cast<unsigned>(got)) !=
                       static_cast<int>(got)) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Compression of {} failed: {}", source.string(),
                msg != nullptr ? msg : "unknown");
      ok = false;
    }
  }
  gzclose(gz);
  in.close();
  std::error_code ec;
  fs::remove(ok ? source : target, ec);
  if (ok) {
    log->debug("Compressed rotated log into {}", target.string());
  }
  return ok;
}

spdlog::sink_ptr make_file_sink(const ghd::LogOptions &options) {
  if (options.rotate == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file,
                                                               false);
  }
  spdlog::file_event_handlers handlers;
  if (options.compress) {
    const std::size_t keep = options.rotate;
    handlers.before_open = [keep](const spdlog::filename_t &filename) {
      fs::path base(spdlog::details::os::filename_to_str(filename));
      shift_archives(base, keep);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest);
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.file, kRotateBytes, options.rotate, false, handlers);
}

} // namespace

namespace ghd {

void init_logger(const LogOptions &options) {
  std::shared_ptr<spdlog::logger> root;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    root = spdlog::get(kRootLogger);
    if (!root) {
      std::vector<spdlog::sink_ptr> sinks{
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      if (!options.file.empty()) {
        sinks.push_back(make_file_sink(options));
      }
      root = make_async(kRootLogger, std::move(sinks));
      spdlog::set_default_logger(root);
      g_root = root;
      g_file_attached = !options.file.empty();
    } else if (!options.file.empty() && !g_file_attached) {
      // Loggers created before configuration only carry the console sink.
      auto sink = make_file_sink(options);
      spdlog::apply_all([&sink](const std::shared_ptr<spdlog::logger> &l) {
        if (l->name().rfind(kRootLogger, 0) == 0) {
          l->sinks().push_back(sink);
        }
      });
      g_file_attached = true;
    }
  }
  spdlog::apply_all([&options](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(kRootLogger, 0) == 0) {
      l->set_level(options.level);
    }
  });
  if (!options.pattern.empty()) {
    spdlog::set_pattern(options.pattern);
  }
  root->debug("Logger initialised (level={}, file='{}', rotate={}, "
              "compress={})",
              spdlog::level::to_string_view(options.level), options.file,
              options.rotate, options.compress);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto ours = g_root.lock();
  if (!ours || current.get() != ours.get()) {
    init_logger(LogOptions{});
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLogger) + "." + category;
  std::shared_ptr<spdlog::logger> parent;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    parent = g_root.lock();
  }
  if (!parent) {
    ensure_default_logger();
    parent = g_root.lock();
  }
  std::lock_guard<std::mutex> lock(g_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto logger = make_async(name, parent->sinks());
  logger->set_level(parent->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "warning") {
    return spdlog::level::warn;
  }
  auto level = spdlog::level::from_str(lower);
  if (level == spdlog::level::off && lower != "off") {
    throw ConfigError("Unknown log level '" + name + "'");
  }
  return level;
}

} // namespace ghd
