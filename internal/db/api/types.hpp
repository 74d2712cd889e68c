#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/work_task_record.hpp"
#include "internal/model/types.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::db {

/*
  Typed partial updates.

  Each engaged optional becomes one "column = ?" in a parameterised UPDATE;
  column names are fixed by the backend, never taken from input. For nullable
  columns the inner optional distinguishes "set to NULL" from "leave alone".
*/

struct WorkerPatch {
  std::optional<std::optional<std::string>> worker_code;
  std::optional<std::string>                full_name;
  std::optional<std::optional<std::string>> factory_id;
  std::optional<piecework::model::PayoutFrequency>     payout;
  std::optional<util::Date>                 anchor_date;
  std::optional<bool>                       active;

  bool Empty() const {
    return !worker_code && !full_name && !factory_id && !payout && !anchor_date && !active;
  }
};

struct WorkTaskPatch {
  std::optional<util::Decimal>              quantity;
  std::optional<std::string>                task_type_id;
  std::optional<std::optional<std::string>> note;

  bool Empty() const {
    return !quantity && !task_type_id && !note;
  }
};

/*
  Decision write; applied only while the task is unpaid and its day is open.

  settled_pay is priced from the quantity and type the caller read. When set,
  expected_quantity / expected_task_type_id make the write fail with Conflict
  if a concurrent edit changed either in the meantime.
*/
struct TaskDecision {
  piecework::model::TaskStatus status = piecework::model::TaskStatus::kPending;
  std::string                  decided_by;
  uint64_t                     decided_at_ms = 0;
  std::optional<std::string>   reason;
  util::Decimal                settled_pay;

  std::optional<util::Decimal> expected_quantity;
  std::optional<std::string>   expected_task_type_id;
};

struct WorkerFilter {
  bool                       active_only = true;
  std::optional<std::string> factory_id;
};

struct PendingTaskFilter {
  std::optional<std::string> worker_id;
  std::optional<util::Date>  start;
  std::optional<util::Date>  end;
  // restrict to days logged by this user (supervisor scope)
  std::optional<std::string> logged_by;
};

// Pending task joined with its day, worker and task type.
struct PendingTaskRow {
  db::model::WorkTaskRecord task;
  util::Date                work_date{};
  std::string               worker_id;
  std::string               worker_name;
  std::string               task_code;
  std::string               unit;
};

// Approved, unpaid task inside a settlement window.
struct EligibleTaskRow {
  std::string           task_id;
  util::Decimal         quantity;
  util::Decimal         settled_pay;
  piecework::model::RubricCategory category = piecework::model::RubricCategory::kNone;
};

} // namespace piecework::db
