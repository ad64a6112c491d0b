/**
 * @file report.hpp
 * @brief Ordering and plain-text rendering of the activity report.
 */
#ifndef GHDIGEST_REPORT_HPP
#define GHDIGEST_REPORT_HPP

#include "activity.hpp"

#include <string>
#include <vector>

namespace ghd {

/**
 * Merge events and notices into a single chronological report.
 *
 * Items are sorted by timestamp ascending. Ties keep their input order with
 * events ahead of notices.
 */
std::vector<ReportItem> order_report(const std::vector<Event> &events,
                                     const std::vector<LifecycleNotice> &notices);

/// Render a single report item.
std::string render_item(const ReportItem &item);

/// Render the report body, items separated by a blank line.
std::string render_report(const std::vector<ReportItem> &items);

/// Prefix every line of @p text with `> `.
std::string quote_text(const std::string &text);

} // namespace ghd

#endif // GHDIGEST_REPORT_HPP
