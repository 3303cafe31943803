#include "time.hpp"

#include <ctime>
#include <stdexcept>

namespace alerts::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  if (gmtime_r(&t, &tm) == nullptr) {
    throw std::invalid_argument("timestamp out of range");
  }
  return tm;
}

std::string Format(TimePoint tp, const char* pattern) {
  const std::tm tm = ToUtc(tp);
  char          buf[32];
  const auto    n = std::strftime(buf, sizeof(buf), pattern, &tm);
  if (n == 0) {
    throw std::invalid_argument("timestamp formatting failed");
  }
  return std::string(buf, n);
}

/*
  Strict fixed-width parser.

  layout uses Y M D h m s for digits; every other character must match
  literally. Dates that do not survive a timegm/gmtime round trip
  (e.g. Feb 30) are rejected.
*/
TimePoint ParseWithLayout(const std::string& text, const std::string& layout) {
  if (text.size() != layout.size()) {
    throw std::invalid_argument("malformed timestamp: " + text);
  }

  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  for (std::size_t i = 0; i < layout.size(); ++i) {
    const char l = layout[i];
    const char c = text[i];
    int*       field = nullptr;
    switch (l) {
      case 'Y': field = &year; break;
      case 'M': field = &month; break;
      case 'D': field = &day; break;
      case 'h': field = &hour; break;
      case 'm': field = &minute; break;
      case 's': field = &second; break;
      default:
        if (c != l) throw std::invalid_argument("malformed timestamp: " + text);
        continue;
    }
    if (c < '0' || c > '9') {
      throw std::invalid_argument("malformed timestamp: " + text);
    }
    *field = *field * 10 + (c - '0');
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    throw std::invalid_argument("timestamp out of range: " + text);
  }

  std::tm check{};
  gmtime_r(&t, &check);
  if (check.tm_year != year - 1900 || check.tm_mon != month - 1 || check.tm_mday != day || check.tm_hour != hour ||
      check.tm_min != minute || check.tm_sec != second) {
    throw std::invalid_argument("invalid calendar time: " + text);
  }

  return Clock::from_time_t(t);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint TruncateToSecond(TimePoint tp) {
  // floor, so pre-epoch instants do not round up
  return std::chrono::floor<std::chrono::seconds>(tp);
}

TimePoint TruncateToMinute(TimePoint tp) {
  return std::chrono::floor<std::chrono::minutes>(tp);
}

std::string FormatSlugMinute(TimePoint tp) {
  return Format(tp, "%Y-%m-%d_%H-%M");
}

std::string FormatFileSecond(TimePoint tp) {
  return Format(tp, "%Y-%m-%d_%H-%M-%S");
}

std::string FormatDisplay(TimePoint tp) {
  return Format(tp, "%Y-%m-%d %H:%M_%S");
}

std::string FormatIso8601(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

TimePoint ParseIso8601(const std::string& text) {
  return ParseWithLayout(text, "YYYY-MM-DDThh:mm:ssZ");
}

TimePoint ParseFileSecond(const std::string& text) {
  return ParseWithLayout(text, "YYYY-MM-DD_hh-mm-ss");
}

TimePoint ParseDisplay(const std::string& text) {
  return ParseWithLayout(text, "YYYY-MM-DD hh:mm_ss");
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixSeconds(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

} // namespace alerts::util
