/**
 * @file notification.cpp
 * @brief Composes the activity e-mail and hands it to a sendmail command.
 */
#include "notification.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "report.hpp"
#include "version.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace ghd {

namespace {

std::shared_ptr<spdlog::logger> notify_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("notify");
  }();
  return logger;
}

std::string base64(const std::string &in) {
  static const char *table =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  std::size_t i = 0;
  while (i + 2 < in.size()) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                 (static_cast<unsigned char>(in[i + 1]) << 8) |
                 static_cast<unsigned char>(in[i + 2]);
    out.push_back(table[(v >> 18) & 0x3F]);
    out.push_back(table[(v >> 12) & 0x3F]);
    out.push_back(table[(v >> 6) & 0x3F]);
    out.push_back(table[v & 0x3F]);
    i += 3;
  }
  std::size_t rest = in.size() - i;
  if (rest > 0) {
    unsigned v = static_cast<unsigned char>(in[i]) << 16;
    if (rest == 2) {
      v |= static_cast<unsigned char>(in[i + 1]) << 8;
    }
    out.push_back(table[(v >> 18) & 0x3F]);
    out.push_back(table[(v >> 12) & 0x3F]);
    out.push_back(rest == 2 ? table[(v >> 6) & 0x3F] : '=');
    out.push_back('=');
  }
  return out;
}

std::filesystem::path temp_message_path() {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("ghdigest-" + std::to_string(::getpid()) + "-" +
          std::to_string(stamp) + ".eml");
}

} // namespace

std::string shell_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string format_rfc5322_date(Timestamp ts) {
  static const char *days[] = {"Sun", "Mon", "Tue", "Wed",
                               "Thu", "Fri", "Sat"};
  static const char *months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d +0000",
                days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon],
                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

std::string encode_header_value(const std::string &value) {
  bool ascii = true;
  for (char c : value) {
    if (static_cast<unsigned char>(c) >= 0x80) {
      ascii = false;
      break;
    }
  }
  if (ascii) {
    return value;
  }
  return "=?utf-8?b?" + base64(value) + "?=";
}

MailNotifier::MailNotifier(MailSettings settings, std::string command,
                           CommandRunner runner)
    : settings_(std::move(settings)), command_(std::move(command)),
      run_(std::move(runner)), clock_(current_time) {}

std::string MailNotifier::render(const std::vector<ReportItem> &items) const {
  if (!settings_.recipient) {
    notify_log()->error("No recipient configured");
    throw ConfigError("recipient address required");
  }
  std::ostringstream msg;
  if (settings_.sender) {
    msg << "From: " << *settings_.sender << "\n";
  }
  msg << "To: " << *settings_.recipient << "\n";
  msg << "Subject: " << encode_header_value(settings_.subject) << "\n";
  msg << "Date: " << format_rfc5322_date(clock_()) << "\n";
  msg << "MIME-Version: 1.0\n";
  msg << "Content-Type: text/plain; charset=utf-8\n";
  msg << "Content-Transfer-Encoding: 8bit\n";
  msg << "User-Agent: ghdigest " << kVersionString << "\n";
  msg << "\n";
  msg << render_report(items) << "\n";
  return msg.str();
}

void MailNotifier::deliver(const std::vector<ReportItem> &items) {
  std::string message = render(items);
  auto path = temp_message_path();
  {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
      throw DeliveryError("Failed to create temporary message file " +
                          path.string());
    }
    out << message;
    if (!out) {
      throw DeliveryError("Failed to write temporary message file " +
                          path.string());
    }
  }
  std::string cmd = command_ + " < " + shell_escape(path.string());
  notify_log()->info("Sending report with {} item(s) to {}", items.size(),
                     *settings_.recipient);
  notify_log()->debug("Running delivery command: {}", cmd);
  int rc = run_(cmd);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    notify_log()->warn("Could not remove {}: {}", path.string(), ec.message());
  }
  if (rc != 0) {
    notify_log()->error("Delivery command exited with status {}", rc);
    throw DeliveryError("Delivery command '" + command_ +
                        "' failed with status " + std::to_string(rc));
  }
}

} // namespace ghd
