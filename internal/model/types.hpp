#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace piecework::model {

enum class PayoutFrequency : std::uint8_t {
  kWeekly = 1,
  kBiweekly = 2,
  kMonthly = 3,
};

enum class TaskStatus : std::uint8_t {
  kPending = 0,
  kApproved = 1,
  kRejected = 2,
};

// Which side of the equivalence rubric a task type counts toward.
enum class RubricCategory : std::uint8_t {
  kNone = 0,
  kPrimary = 1,
  kSecondary = 2,
};

constexpr std::string_view ToString(PayoutFrequency frequency) {
  switch (frequency) {
    case PayoutFrequency::kWeekly:
      return "weekly";
    case PayoutFrequency::kBiweekly:
      return "biweekly";
    case PayoutFrequency::kMonthly:
    default:
      return "monthly";
  }
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kApproved:
      return "approved";
    case TaskStatus::kRejected:
      return "rejected";
    case TaskStatus::kPending:
    default:
      return "pending";
  }
}

constexpr std::string_view ToString(RubricCategory category) {
  switch (category) {
    case RubricCategory::kPrimary:
      return "primary";
    case RubricCategory::kSecondary:
      return "secondary";
    case RubricCategory::kNone:
    default:
      return "none";
  }
}

constexpr std::optional<PayoutFrequency> ParsePayoutFrequency(std::string_view text) {
  if (text == "weekly") return PayoutFrequency::kWeekly;
  if (text == "biweekly") return PayoutFrequency::kBiweekly;
  if (text == "monthly") return PayoutFrequency::kMonthly;
  return std::nullopt;
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view text) {
  if (text == "pending") return TaskStatus::kPending;
  if (text == "approved") return TaskStatus::kApproved;
  if (text == "rejected") return TaskStatus::kRejected;
  return std::nullopt;
}

constexpr std::optional<RubricCategory> ParseRubricCategory(std::string_view text) {
  if (text == "none") return RubricCategory::kNone;
  if (text == "primary") return RubricCategory::kPrimary;
  if (text == "secondary") return RubricCategory::kSecondary;
  return std::nullopt;
}

}  // namespace piecework::model
