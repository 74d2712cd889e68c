#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/types.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::db::model {

// Settlement snapshot header. Immutable once written; only items are appended.
struct PayrollRunRecord {
  std::string                id;
  util::Date                 as_of{};
  std::string                created_by;
  std::optional<std::string> note;
  uint64_t                   created_at_ms = 0;
};

// Per-worker totals at the moment of settlement; unique per (run_id, worker_id).
struct PayrollRunItemRecord {
  std::string run_id;
  std::string worker_id;
  std::string worker_name;

  piecework::model::PayoutFrequency payout = piecework::model::PayoutFrequency::kWeekly;

  util::Date period_start{};
  util::Date period_end{};

  util::Decimal total_pay;
  util::Decimal primary_quantity;
  util::Decimal secondary_quantity;

  uint32_t task_count = 0;
};

} // namespace piecework::db::model
