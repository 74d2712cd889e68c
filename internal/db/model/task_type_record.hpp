#pragma once

#include <string>

#include "internal/model/types.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::db::model {

struct TaskTypeRecord {
  std::string id;
  std::string code; // COMBING, WEAVING, ...
  std::string name;
  std::string unit; // kg, m, ...

  util::Decimal default_rate;

  piecework::model::RubricCategory category = piecework::model::RubricCategory::kNone;
};

// Worker-specific override; at most one per (worker_id, task_type_id).
struct WorkerRateRecord {
  std::string   worker_id;
  std::string   task_type_id;
  util::Decimal rate;
};

} // namespace piecework::db::model
