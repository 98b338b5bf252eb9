#include "predict/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace predict {
namespace time_utils {

namespace {

struct CivilDate {
  int year;
  unsigned month;
  unsigned day;
};

// Inverse of daysFromCivil (H. Hinnant's civil_from_days).
CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool isLeap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeap(year)) {
    return 29;
  }
  return kDays[month - 1];
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Reads exactly `width` digits at text[pos]; advances pos.
bool readDigits(std::string_view text, std::size_t& pos, std::size_t width,
                int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

// Parses "YYYY-MM-DD" at pos; validates ranges.
bool readDate(std::string_view text, std::size_t& pos, CivilDate& out) {
  int y = 0;
  int m = 0;
  int d = 0;
  if (!readDigits(text, pos, 4, y) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, m) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, d)) {
    return false;
  }
  if (m < 1 || m > 12) {
    return false;
  }
  if (d < 1 || static_cast<unsigned>(d) > daysInMonth(y, m)) {
    return false;
  }
  out = CivilDate{y, static_cast<unsigned>(m), static_cast<unsigned>(d)};
  return true;
}

}  // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
  const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::int64_t startOfDay(std::int64_t ms) {
  return floorDiv(ms, kMsPerDay) * kMsPerDay;
}

std::string dayKey(std::int64_t ms) {
  const CivilDate date = civilFromDays(floorDiv(ms, kMsPerDay));
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", date.year, date.month,
                date.day);
  return buf;
}

std::optional<std::int64_t> parseDayKey(std::string_view key) {
  std::size_t pos = 0;
  CivilDate date{};
  if (!readDate(key, pos, date) || pos != key.size()) {
    return std::nullopt;
  }
  return daysFromCivil(date.year, date.month, date.day) * kMsPerDay;
}

std::string isoTimestamp(std::int64_t ms) {
  const std::int64_t days = floorDiv(ms, kMsPerDay);
  const CivilDate date = civilFromDays(days);
  std::int64_t rem = ms - days * kMsPerDay;
  const auto hours = static_cast<int>(rem / kMsPerHour);
  rem %= kMsPerHour;
  const auto minutes = static_cast<int>(rem / kMsPerMinute);
  rem %= kMsPerMinute;
  const auto seconds = static_cast<int>(rem / kMsPerSecond);
  const auto millis = static_cast<int>(rem % kMsPerSecond);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                date.year, date.month, date.day, hours, minutes, seconds,
                millis);
  return buf;
}

std::optional<std::int64_t> parseIsoTimestamp(std::string_view text) {
  std::size_t pos = 0;
  CivilDate date{};
  if (!readDate(text, pos, date)) {
    return std::nullopt;
  }
  std::int64_t ms = daysFromCivil(date.year, date.month, date.day) * kMsPerDay;
  if (pos == text.size()) {
    return ms;
  }

  if (text[pos] != 'T' && text[pos] != ' ') {
    return std::nullopt;
  }
  ++pos;

  int hh = 0;
  int mm = 0;
  int ss = 0;
  if (!readDigits(text, pos, 2, hh) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, mm)) {
    return std::nullopt;
  }
  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!readDigits(text, pos, 2, ss)) {
      return std::nullopt;
    }
  }
  if (hh > 23 || mm > 59 || ss > 60) {
    return std::nullopt;
  }

  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int scale = 100;
    std::size_t digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (scale > 0) {
        millis += (text[pos] - '0') * scale;
        scale /= 10;
      }
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  ms += hh * kMsPerHour + mm * kMsPerMinute + ss * kMsPerSecond + millis;

  if (pos == text.size()) {
    return ms;
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    return pos + 1 == text.size() ? std::optional<std::int64_t>(ms)
                                  : std::nullopt;
  }
  if (text[pos] == '+' || text[pos] == '-') {
    const int sign = text[pos] == '+' ? 1 : -1;
    ++pos;
    int oh = 0;
    int om = 0;
    if (!readDigits(text, pos, 2, oh)) {
      return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
    }
    if (!readDigits(text, pos, 2, om) || pos != text.size() || oh > 23 ||
        om > 59) {
      return std::nullopt;
    }
    return ms - sign * (oh * kMsPerHour + om * kMsPerMinute);
  }
  return std::nullopt;
}

}  // namespace time_utils
}  // namespace predict
