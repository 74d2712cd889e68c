#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/types.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::db::model {

/*
  Quantified unit of piecework.

  IMPORTANT:
  - paid_run_id is the settlement claim. Once non-null, status, quantity and
    settled_pay are immutable; every write path conditions on it being null.
  - settled_pay is fixed at decision time (quantity x resolved rate, rounded to
    the currency minor unit) so later rate changes never reprice approved work.
*/

struct WorkTaskRecord {
  std::string id;
  std::string work_day_id;
  std::string task_type_id;

  util::Decimal              quantity;
  std::optional<std::string> note;

  piecework::model::TaskStatus status = piecework::model::TaskStatus::kPending;

  std::optional<std::string> decided_by;
  std::optional<uint64_t>    decided_at_ms;
  std::optional<std::string> decision_reason;

  util::Decimal settled_pay;

  std::optional<std::string> paid_run_id;
  std::optional<uint64_t>    paid_at_ms;

  uint64_t                   created_at_ms = 0;
  std::optional<std::string> updated_by;
  std::optional<uint64_t>    updated_at_ms;

  bool IsPaid() const {
    return paid_run_id.has_value();
  }
};

} // namespace piecework::db::model
