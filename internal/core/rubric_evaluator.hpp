#pragma once

#include <vector>

#include "internal/model/types.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::runtime::config {
class RuntimeConfig;
}

namespace piecework::core {

struct RubricSettings {
  // units of primary output per day
  util::Decimal daily_target = util::Decimal::FromInt(1);
  // secondary units worth one primary unit
  util::Decimal secondary_per_primary = util::Decimal::FromInt(60);

  // Throws util::Validation on malformed or non-positive values.
  static RubricSettings FromConfig(const piecework::runtime::config::RuntimeConfig& config);
};

struct RubricResult {
  util::Decimal progress;
  bool          target_met = false;
  // secondary output needed if primary alone were counted
  util::Decimal remaining_secondary_to_equivalence;
  // primary output needed if secondary alone were counted
  util::Decimal remaining_primary_to_equivalence;
};

struct RubricTask {
  model::RubricCategory category = model::RubricCategory::kNone;
  model::TaskStatus     status   = model::TaskStatus::kPending;
  util::Decimal         quantity;
};

// Same day viewed over everything logged and over approved work only.
struct DayRubric {
  RubricResult logged;
  RubricResult approved;
};

/*
  Daily equivalence rubric.

    progress = primary + secondary / secondary_per_primary

  Guidance only; pay never depends on it.
*/
class RubricEvaluator {
 public:
  explicit RubricEvaluator(RubricSettings settings = {});

  RubricResult Evaluate(util::Decimal primary, util::Decimal secondary) const;

  DayRubric EvaluateDay(const std::vector<RubricTask>& tasks) const;

  const RubricSettings& Settings() const {
    return settings_;
  }

 private:
  RubricSettings settings_;
};

} // namespace piecework::core
