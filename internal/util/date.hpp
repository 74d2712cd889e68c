#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace piecework::util {

/*
  Calendar dates.

  Work days, anchors and settlement periods are civil dates with no time zone;
  persisted as ISO-8601 "YYYY-MM-DD", which also sorts lexicographically.
*/

using Date = std::chrono::year_month_day;

std::optional<Date> TryParseIsoDate(std::string_view text);
// Throws util::Validation on malformed or impossible dates.
Date        ParseIsoDate(std::string_view text);
std::string FormatIsoDate(const Date& date);

Date AddDays(const Date& date, int days);
// Signed day count (to - from).
int  DaysBetween(const Date& from, const Date& to);
Date LastDayOfMonth(std::chrono::year year, std::chrono::month month);

// UTC calendar date of the system clock.
Date Today();

} // namespace piecework::util
