#include "internal/util/date.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace piecework::util {

using namespace std::chrono;

std::optional<Date> TryParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int fields[3]   = {0, 0, 0};
  int field_index = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      ++field_index;
      continue;
    }
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    fields[field_index] = fields[field_index] * 10 + (c - '0');
  }

  const Date date{year{fields[0]}, month{static_cast<unsigned>(fields[1])}, day{static_cast<unsigned>(fields[2])}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

Date ParseIsoDate(std::string_view text) {
  auto date = TryParseIsoDate(text);
  if (!date) {
    throw Validation("invalid date (expected YYYY-MM-DD): '" + std::string(text) + "'");
  }
  return *date;
}

std::string FormatIsoDate(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

Date AddDays(const Date& date, int days) {
  return Date{sys_days{date} + std::chrono::days{days}};
}

int DaysBetween(const Date& from, const Date& to) {
  return static_cast<int>((sys_days{to} - sys_days{from}).count());
}

Date LastDayOfMonth(std::chrono::year y, std::chrono::month m) {
  return Date{year_month_day_last{y, month_day_last{m}}};
}

Date Today() {
  return Date{floor<std::chrono::days>(system_clock::now())};
}

} // namespace piecework::util
