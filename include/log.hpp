/**
 * @file log.hpp
 * @brief Logging setup for ghdigest.
 *
 * All components log through spdlog. A process-wide asynchronous logger
 * named `ghdigest` owns the sinks, and each component obtains a child
 * logger `ghdigest.<category>` sharing them so levels can be tuned per
 * category.
 */

#ifndef GHDIGEST_LOG_HPP
#define GHDIGEST_LOG_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace ghd {

/// Categories used by ghdigest components.
inline constexpr std::array<const char *, 10> kLogCategories = {
    "app",     "cli",   "config", "diff", "github.client",
    "logging", "notify", "pool",  "repos", "state"};

/// Options controlling the default logger.
struct LogOptions {
  spdlog::level::level_enum level{spdlog::level::warn};
  std::string pattern{};   ///< Empty keeps the spdlog default
  std::string file{};      ///< Optional log file
  std::size_t rotate{3};   ///< Rotated files kept (0 = plain file sink)
  bool compress{false};    ///< Gzip rotated files
};

/**
 * Initialize the default logger with a console sink and an optional file
 * sink. Calling it again only adjusts the level and pattern.
 */
void init_logger(const LogOptions &options);

/**
 * Retrieve or create the logger for @p category.
 *
 * @return Logger named `ghdigest.<category>` sharing the default sinks.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Apply per-category level overrides.
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Create a default logger on demand when none was initialized yet.
void ensure_default_logger();

/**
 * Parse a level name (`trace`, `debug`, `info`, `warn`, `warning`, `error`,
 * `critical`, `off`), case-insensitively.
 *
 * @throws ConfigError For unknown names.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

} // namespace ghd

#endif // GHDIGEST_LOG_HPP
