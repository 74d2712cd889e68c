#include "internal/core/period_calculator.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace piecework::core {

using namespace std::chrono;

namespace {

int BlockDays(model::PayoutFrequency frequency) {
  return frequency == model::PayoutFrequency::kWeekly ? 7 : 14;
}

// anchor day-of-month in the given month, clamped to its length
util::Date ClampedDay(year_month ym, day anchor_day) {
  const auto last = util::LastDayOfMonth(ym.year(), ym.month()).day();
  return util::Date{ym.year(), ym.month(), std::min(anchor_day, last)};
}

Period MonthlyPeriod(util::Date anchor, util::Date as_of) {
  const auto anchor_day = anchor.day();

  util::Date start = anchor;
  if (as_of >= anchor) {
    year_month ym{as_of.year(), as_of.month()};
    start = ClampedDay(ym, anchor_day);
    if (start > as_of) {
      start = ClampedDay(ym - months{1}, anchor_day);
    }
  }

  const year_month next{start.year(), start.month()};
  const auto       next_start = ClampedDay(next + months{1}, anchor_day);
  return Period{start, util::AddDays(next_start, -1)};
}

Period BlockPeriod(int block, util::Date anchor, util::Date as_of) {
  int index = 0;
  if (as_of >= anchor) {
    index = util::DaysBetween(anchor, as_of) / block;
  }
  const auto start = util::AddDays(anchor, index * block);
  return Period{start, util::AddDays(start, block - 1)};
}

} // namespace

int Period::LengthDays() const {
  return util::DaysBetween(start, end) + 1;
}

Period SettlementPeriod(model::PayoutFrequency frequency, util::Date anchor, util::Date as_of) {
  if (frequency == model::PayoutFrequency::kMonthly) {
    return MonthlyPeriod(anchor, as_of);
  }
  return BlockPeriod(BlockDays(frequency), anchor, as_of);
}

Period CurrentProgressPeriod(model::PayoutFrequency frequency, util::Date anchor, util::Date as_of) {
  auto period = SettlementPeriod(frequency, anchor, as_of);
  if (as_of >= period.start) {
    period.end = std::min(period.end, as_of);
  }
  return period;
}

model::PayoutFrequency ParseFrequency(std::string_view text) {
  const auto frequency = model::ParsePayoutFrequency(text);
  if (!frequency) {
    throw util::Validation("payout frequency must be weekly, biweekly or monthly: '" + std::string(text) + "'");
  }
  return *frequency;
}

} // namespace piecework::core
