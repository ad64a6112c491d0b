#include "report.hpp"

#include <algorithm>
#include <sstream>

namespace ghd {

namespace {

std::string by_author(const std::string &login) {
  return login.empty() ? std::string() : " (@" + login + ")";
}

std::string render_event(const Event &ev) {
  const std::string repo = "[" + ev.repo.full_name() + "] ";
  std::string s;
  switch (ev.type) {
  case ActivityType::Issue:
  case ActivityType::PullRequest:
  case ActivityType::Discussion: {
    std::string kind = ev.type == ActivityType::Issue         ? "ISSUE"
                       : ev.type == ActivityType::PullRequest ? "PR"
                                                              : "DISCUSSION";
    s = repo + kind + " #" + std::to_string(ev.number) + ": " + ev.title +
        by_author(ev.author) + "\n<" + ev.url + ">";
    break;
  }
  case ActivityType::Release:
    s = repo + "RELEASE " + ev.tag_name;
    if (ev.draft)
      s += " [draft]";
    if (ev.prerelease)
      s += " [prerelease]";
    if (!ev.name.empty())
      s += ": " + ev.name;
    s += by_author(ev.author) + "\n<" + ev.url + ">";
    if (!ev.body.empty())
      s += "\n" + quote_text(ev.body);
    break;
  case ActivityType::Tag:
    s = repo + "TAG " + ev.name + by_author(ev.author) + "\n<" + ev.repo.url +
        "/releases/tag/" + ev.name + ">";
    break;
  case ActivityType::Star:
    s = "★ @" + ev.author + " starred " + ev.repo.full_name();
    break;
  case ActivityType::Fork:
    s = "@" + ev.author + " forked " + ev.repo.full_name() + "\n<" +
        ev.fork_url + ">";
    break;
  }
  return s;
}

std::string render_notice(const LifecycleNotice &notice) {
  switch (notice.kind) {
  case LifecycleNotice::Kind::NewlyTracked: {
    std::string s = "Now tracking repository " + notice.repo.full_name() +
                    "\n<" + notice.repo.url + ">";
    if (!notice.repo.description.empty())
      s += "\n" + quote_text(notice.repo.description);
    return s;
  }
  case LifecycleNotice::Kind::NoLongerTracked:
    return "No longer tracking repository " + notice.repo.full_name();
  case LifecycleNotice::Kind::Renamed:
    return "Repository renamed: " + notice.old_owner + "/" + notice.old_name +
           " → " + notice.repo.full_name();
  }
  return {};
}

} // namespace

std::vector<ReportItem>
order_report(const std::vector<Event> &events,
             const std::vector<LifecycleNotice> &notices) {
  std::vector<ReportItem> items;
  items.reserve(events.size() + notices.size());
  items.insert(items.end(), events.begin(), events.end());
  items.insert(items.end(), notices.begin(), notices.end());
  std::stable_sort(items.begin(), items.end(),
                   [](const ReportItem &a, const ReportItem &b) {
                     return item_timestamp(a) < item_timestamp(b);
                   });
  return items;
}

std::string render_item(const ReportItem &item) {
  if (const auto *ev = std::get_if<Event>(&item)) {
    return render_event(*ev);
  }
  return render_notice(std::get<LifecycleNotice>(item));
}

std::string render_report(const std::vector<ReportItem> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty())
      out += "\n\n";
    out += render_item(item);
  }
  return out;
}

std::string quote_text(const std::string &text) {
  std::string trimmed = text;
  while (!trimmed.empty() &&
         (trimmed.back() == '\n' || trimmed.back() == '\r')) {
    trimmed.pop_back();
  }
  std::istringstream in(trimmed);
  std::string line;
  std::string out;
  bool first = true;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!first)
      out += '\n';
    first = false;
    out += line.empty() ? ">" : "> " + line;
  }
  return out;
}

} // namespace ghd
