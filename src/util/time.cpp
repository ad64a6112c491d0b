#include "util/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ghd {

namespace {

int read_two_digits(const std::string &s, std::size_t &i) {
  if (i + 2 > s.size() || !std::isdigit(static_cast<unsigned char>(s[i])) ||
      !std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
    throw std::invalid_argument("Invalid UTC offset");
  }
  int value = (s[i] - '0') * 10 + (s[i + 1] - '0');
  i += 2;
  return value;
}

} // namespace

/**
 * Parse an ISO-8601 timestamp.
 *
 * @param text Timestamp such as `2024-03-01T12:30:00Z`.
 * @return UTC time point.
 * @throws std::invalid_argument When the input is malformed.
 */
Timestamp parse_timestamp(const std::string &text) {
  std::tm tm{};
  std::istringstream ss(text);
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    throw std::invalid_argument("Invalid timestamp: " + text);
  }
  std::string rest;
  std::getline(ss, rest);

  std::size_t i = 0;
  if (i < rest.size() && rest[i] == '.') {
    ++i;
    while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i])))
      ++i;
  }
  long offset = 0;
  if (i < rest.size()) {
    char c = rest[i];
    if (c == 'Z' || c == 'z') {
      ++i;
    } else if (c == '+' || c == '-') {
      ++i;
      try {
        int hours = read_two_digits(rest, i);
        if (i < rest.size() && rest[i] == ':')
          ++i;
        int minutes = read_two_digits(rest, i);
        offset = (hours * 3600L + minutes * 60L) * (c == '-' ? -1 : 1);
      } catch (const std::invalid_argument &) {
        throw std::invalid_argument("Invalid timestamp: " + text);
      }
    }
  }
  if (i != rest.size()) {
    throw std::invalid_argument("Invalid timestamp: " + text);
  }
#ifdef _WIN32
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  return std::chrono::system_clock::from_time_t(t) -
         std::chrono::seconds(offset);
}

std::string format_timestamp(Timestamp ts) {
  std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

Timestamp current_time() {
  return std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::now());
}

} // namespace ghd
