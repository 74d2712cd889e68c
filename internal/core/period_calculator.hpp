#pragma once

#include <string_view>

#include "internal/model/types.hpp"
#include "internal/util/date.hpp"

namespace piecework::core {

/*
  Settlement periods.

  weekly/biweekly: contiguous 7/14 day blocks starting at the anchor.
  monthly: from the anchor's day-of-month to the day before the next one,
  with the day clamped to short months (anchor 31 -> Feb 28/29, Apr 30).

  An as_of before the anchor resolves to the first block starting at the anchor.
*/

struct Period {
  util::Date start{};
  util::Date end{};

  bool Contains(const util::Date& date) const {
    return start <= date && date <= end;
  }

  // inclusive day count
  int LengthDays() const;

  bool operator==(const Period&) const = default;
};

// Full block containing as_of.
Period SettlementPeriod(model::PayoutFrequency frequency, util::Date anchor, util::Date as_of);

// Same start as SettlementPeriod, end capped at as_of: the period so far.
Period CurrentProgressPeriod(model::PayoutFrequency frequency, util::Date anchor, util::Date as_of);

// Throws util::Validation on anything but weekly|biweekly|monthly.
model::PayoutFrequency ParseFrequency(std::string_view text);

} // namespace piecework::core
