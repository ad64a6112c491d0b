#ifndef GHDIGEST_NOTIFICATION_HPP
#define GHDIGEST_NOTIFICATION_HPP

#include "activity.hpp"
#include "util/time.hpp"

#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ghd {

/**
 * Interface for delivering an activity report.
 *
 * Implementations receive the already ordered report items.
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  /**
   * Send the report.
   *
   * @param items Report items in chronological order.
   * @throws DeliveryError When the report could not be handed off.
   */
  virtual void deliver(const std::vector<ReportItem> &items) = 0;

  /// Format the report exactly as deliver() would send it.
  virtual std::string render(const std::vector<ReportItem> &items) const = 0;
};

/// Addressing for composed messages.
struct MailSettings {
  std::optional<std::string> recipient;
  std::optional<std::string> sender;
  std::string subject;
};

/**
 * Notifier that composes a plain-text e-mail and pipes it into a
 * sendmail-compatible command.
 */
class MailNotifier : public Notifier {
public:
  using CommandRunner = std::function<int(const std::string &)>;
  using Clock = std::function<Timestamp()>;

  /**
   * @param settings Recipient, sender and subject of the message.
   * @param command Delivery command; the message is supplied on stdin.
   * @param runner Callback executing shell commands. The default delegates to
   *        `std::system`.
   */
  MailNotifier(MailSettings settings, std::string command,
               CommandRunner runner = [](const std::string &cmd) {
                 return std::system(cmd.c_str());
               });

  void deliver(const std::vector<ReportItem> &items) override;

  /**
   * Compose the full message, headers included.
   *
   * @throws ConfigError When no recipient is configured.
   */
  std::string render(const std::vector<ReportItem> &items) const override;

  /// Replace the clock used for the `Date` header.
  void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
  MailSettings settings_;
  std::string command_;
  CommandRunner run_;
  Clock clock_;
};

using NotifierPtr = std::shared_ptr<Notifier>;

/// Quote a string for safe use in POSIX shells.
std::string shell_escape(const std::string &s);

/// Format @p ts as an RFC 5322 date (`Tue, 05 Mar 2024 09:00:00 +0000`).
std::string format_rfc5322_date(Timestamp ts);

/**
 * Encode a header value as an RFC 2047 encoded word when it contains
 * non-ASCII bytes. ASCII values are returned unchanged.
 */
std::string encode_header_value(const std::string &value);

} // namespace ghd

#endif // GHDIGEST_NOTIFICATION_HPP
