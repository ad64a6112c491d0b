/**
 * @file time.hpp
 * @brief ISO-8601 timestamp helpers.
 *
 * GitHub reports timestamps as UTC ISO-8601 strings. The state file stores
 * cutoffs in the same representation with second precision.
 */
#ifndef GHDIGEST_UTIL_TIME_HPP
#define GHDIGEST_UTIL_TIME_HPP

#include <chrono>
#include <string>

namespace ghd {

/// Point in time used for events, cutoffs and notices.
using Timestamp = std::chrono::system_clock::time_point;

/**
 * Parse an ISO-8601 timestamp such as `2024-03-01T12:30:00Z`.
 *
 * Fractional seconds are ignored. Numeric offsets (`+02:00`, `-0500`) are
 * applied so the result is always UTC.
 *
 * @param text Timestamp string.
 * @return Parsed time point.
 * @throws std::invalid_argument When the text is not a valid timestamp.
 */
Timestamp parse_timestamp(const std::string &text);

/// Format a time point as `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_timestamp(Timestamp ts);

/// Current time truncated to whole seconds.
Timestamp current_time();

} // namespace ghd

#endif // GHDIGEST_UTIL_TIME_HPP
