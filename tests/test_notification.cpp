#include "errors.hpp"
#include "notification.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace ghd;

namespace {
std::vector<ReportItem> one_star() {
  Event ev;
  ev.type = ActivityType::Star;
  ev.repo = RepoRef{"R_1", "acme", "widget", "https://github.com/acme/widget",
                    ""};
  ev.timestamp = parse_timestamp("2024-03-04T10:00:00Z");
  ev.author = "octocat";
  return {ev};
}

MailSettings settings() {
  MailSettings s;
  s.recipient = "me@example.com";
  s.sender = "ghdigest <bot@example.com>";
  s.subject = "News";
  return s;
}

std::string file_from_command(const std::string &cmd) {
  auto pos = cmd.find("< '");
  if (pos == std::string::npos) {
    return {};
  }
  std::string path = cmd.substr(pos + 3);
  path.pop_back(); // closing quote
  return path;
}
} // namespace

TEST_CASE("shell_escape quotes single quotes") {
  CHECK(shell_escape("plain") == "'plain'");
  CHECK(shell_escape("it's") == "'it'\\''s'");
  CHECK(shell_escape("") == "''");
}

TEST_CASE("RFC 5322 dates are rendered in UTC") {
  CHECK(format_rfc5322_date(parse_timestamp("2024-03-05T09:00:00Z")) ==
        "Tue, 05 Mar 2024 09:00:00 +0000");
  CHECK(format_rfc5322_date(parse_timestamp("2023-12-31T23:59:59+01:00")) ==
        "Sun, 31 Dec 2023 22:59:59 +0000");
}

TEST_CASE("non-ASCII header values become encoded words") {
  CHECK(encode_header_value("Plain subject") == "Plain subject");
  // "★" is E2 98 85
  CHECK(encode_header_value("\xE2\x98\x85") == "=?utf-8?b?4piF?=");
  CHECK(encode_header_value("a\xC3\xA9") == "=?utf-8?b?YcOp?=");
}

TEST_CASE("mail notifier renders headers and body") {
  MailNotifier notifier(settings(), "sendmail -t -i",
                        [](const std::string &) { return 0; });
  notifier.set_clock(
      [] { return parse_timestamp("2024-03-05T09:00:00Z"); });
  std::string msg = notifier.render(one_star());
  CHECK(msg.rfind("From: ghdigest <bot@example.com>\nTo: me@example.com\n"
                  "Subject: News\nDate: Tue, 05 Mar 2024 09:00:00 +0000\n"
                  "MIME-Version: 1.0\n"
                  "Content-Type: text/plain; charset=utf-8\n",
                  0) == 0);
  auto body = msg.find("\n\n");
  REQUIRE(body != std::string::npos);
  CHECK(msg.substr(body + 2) == "★ @octocat starred acme/widget\n");
}

TEST_CASE("mail notifier omits From without a sender") {
  auto s = settings();
  s.sender.reset();
  MailNotifier notifier(s, "sendmail", [](const std::string &) { return 0; });
  CHECK(notifier.render(one_star()).rfind("To: me@example.com\n", 0) == 0);
}

TEST_CASE("mail notifier requires a recipient") {
  auto s = settings();
  s.recipient.reset();
  MailNotifier notifier(s, "sendmail", [](const std::string &) { return 0; });
  CHECK_THROWS_AS(notifier.render(one_star()), ConfigError);
  CHECK_THROWS_AS(notifier.deliver(one_star()), ConfigError);
}

TEST_CASE("mail notifier pipes the message into the command") {
  std::vector<std::string> cmds;
  std::string delivered;
  std::string message_file;
  MailNotifier notifier(settings(), "sendmail -t -i",
                        [&](const std::string &cmd) {
                          cmds.push_back(cmd);
                          message_file = file_from_command(cmd);
                          std::ifstream in(message_file);
                          std::ostringstream ss;
                          ss << in.rdbuf();
                          delivered = ss.str();
                          return 0;
                        });
  notifier.set_clock(
      [] { return parse_timestamp("2024-03-05T09:00:00Z"); });
  notifier.deliver(one_star());
  REQUIRE(cmds.size() == 1);
  CHECK(cmds[0].rfind("sendmail -t -i < '", 0) == 0);
  CHECK(delivered == notifier.render(one_star()));
  CHECK_FALSE(message_file.empty());
  CHECK_FALSE(std::filesystem::exists(message_file));
}

TEST_CASE("failed delivery command raises DeliveryError") {
  std::string message_file;
  MailNotifier notifier(settings(), "false", [&](const std::string &cmd) {
    message_file = file_from_command(cmd);
    return 256;
  });
  CHECK_THROWS_AS(notifier.deliver(one_star()), DeliveryError);
  CHECK_FALSE(std::filesystem::exists(message_file));
}
