#include "date_utils.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>

namespace {

int parse_digits(const std::string &text, std::size_t pos, std::size_t len) {
  int value = 0;
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("invalid date '" + text +
                                  "', expected YYYY-MM-DD");
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

} // namespace

std::int64_t parse_iso_date(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw std::invalid_argument("invalid date '" + text +
                                "', expected YYYY-MM-DD");
  }

  std::tm tm{};
  tm.tm_year = parse_digits(text, 0, 4) - 1900;
  tm.tm_mon = parse_digits(text, 5, 2) - 1;
  tm.tm_mday = parse_digits(text, 8, 2);
  const int year = tm.tm_year;
  const int month = tm.tm_mon;
  const int day = tm.tm_mday;

  std::time_t epoch = timegm(&tm);
  if (epoch == static_cast<std::time_t>(-1)) {
    throw std::invalid_argument("failed to convert date '" + text + "'");
  }
  // timegm нормализует 2025-02-30 в 2025-03-02, такие даты отклоняем.
  if (tm.tm_year != year || tm.tm_mon != month || tm.tm_mday != day) {
    throw std::invalid_argument("date '" + text + "' does not exist");
  }
  return static_cast<std::int64_t>(epoch);
}

std::string format_iso_date(std::int64_t epoch) {
  std::time_t t = static_cast<std::time_t>(epoch);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return buf;
}

std::int64_t utc_midnight(std::int64_t epoch) {
  std::int64_t rem = epoch % kSecondsPerDay;
  if (rem < 0) {
    rem += kSecondsPerDay;
  }
  return epoch - rem;
}

std::int64_t today_utc() {
  return utc_midnight(static_cast<std::int64_t>(std::time(nullptr)));
}

std::int64_t days_between(std::int64_t from, std::int64_t to) {
  return (utc_midnight(to) - utc_midnight(from)) / kSecondsPerDay;
}

bool is_weekend(std::int64_t epoch) {
  std::time_t t = static_cast<std::time_t>(epoch);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm.tm_wday == 0 || tm.tm_wday == 6;
}
