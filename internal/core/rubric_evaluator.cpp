#include "internal/core/rubric_evaluator.hpp"

#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace piecework::core {

namespace {

util::Decimal PositiveSetting(const std::string& text, const util::Decimal& fallback, const char* name) {
  if (text.empty()) {
    return fallback;
  }
  const auto parsed = util::Decimal::TryParse(text);
  if (!parsed) {
    throw util::Validation(std::string("settlement.rubric.") + name + " is not a decimal: '" + text + "'");
  }
  const auto value = *parsed;
  if (value <= util::Decimal{}) {
    throw util::Validation(std::string("settlement.rubric.") + name + " must be positive");
  }
  return value;
}

} // namespace

RubricSettings RubricSettings::FromConfig(const piecework::runtime::config::RuntimeConfig& config) {
  RubricSettings settings;
  const auto&    rubric         = config.settlement().rubric();
  settings.daily_target          = PositiveSetting(rubric.daily_target(), settings.daily_target, "daily_target");
  settings.secondary_per_primary = PositiveSetting(rubric.secondary_per_primary(), settings.secondary_per_primary,
                                                   "secondary_per_primary");
  return settings;
}

RubricEvaluator::RubricEvaluator(RubricSettings settings) : settings_(std::move(settings)) {
  if (settings_.daily_target <= util::Decimal{} || settings_.secondary_per_primary <= util::Decimal{}) {
    throw util::Validation("rubric settings must be positive");
  }
}

RubricResult RubricEvaluator::Evaluate(util::Decimal primary, util::Decimal secondary) const {
  const auto& target = settings_.daily_target;
  const auto& ratio  = settings_.secondary_per_primary;

  RubricResult result;
  result.progress   = primary + util::Decimal::Divide(secondary, ratio, util::Decimal::kScale);
  result.target_met = result.progress >= target;

  result.remaining_secondary_to_equivalence =
      util::Max(util::Decimal::Multiply(target - primary, ratio, util::Decimal::kScale), util::Decimal{});

  const auto secondary_target = util::Decimal::Multiply(target, ratio, util::Decimal::kScale);
  result.remaining_primary_to_equivalence =
      util::Max(util::Decimal::Divide(secondary_target - secondary, ratio, util::Decimal::kScale), util::Decimal{});
  return result;
}

DayRubric RubricEvaluator::EvaluateDay(const std::vector<RubricTask>& tasks) const {
  util::Decimal logged_primary, logged_secondary;
  util::Decimal approved_primary, approved_secondary;

  for (const auto& task : tasks) {
    const bool approved = task.status == model::TaskStatus::kApproved;
    if (task.category == model::RubricCategory::kPrimary) {
      logged_primary += task.quantity;
      if (approved) approved_primary += task.quantity;
    } else if (task.category == model::RubricCategory::kSecondary) {
      logged_secondary += task.quantity;
      if (approved) approved_secondary += task.quantity;
    }
  }

  return DayRubric{Evaluate(logged_primary, logged_secondary), Evaluate(approved_primary, approved_secondary)};
}

} // namespace piecework::core
