#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/types.hpp"
#include "internal/util/date.hpp"

namespace piecework::db::model {

/*
  Worker row.

  Never hard-deleted; deactivation clears `active`, which removes the worker
  from settlement and payroll-due scans.
*/

struct WorkerRecord {
  std::string                id;
  std::optional<std::string> worker_code;
  std::string                full_name;

  // supervisor scoping
  std::optional<std::string> factory_id;

  piecework::model::PayoutFrequency payout = piecework::model::PayoutFrequency::kWeekly;

  // defines where recurring settlement periods begin
  util::Date anchor_date{};

  bool active = true;

  uint64_t created_at_ms = 0;
};

} // namespace piecework::db::model
