#pragma once

#include "internal/model/types.hpp"

namespace piecework::model {

/*
  Work task approval states.

    pending --> approved | rejected
    approved <--> rejected          (while unpaid)

  Re-deciding an unpaid task is allowed (mistakes are corrected before
  settlement). Once a payroll run has claimed the task it is terminal
  regardless of its status, and nothing ever returns to pending.
*/

constexpr bool IsDecision(TaskStatus status) {
  return status == TaskStatus::kApproved || status == TaskStatus::kRejected;
}

constexpr bool IsTerminal(TaskStatus, bool paid) {
  return paid;
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to, bool paid) {
  if (IsTerminal(from, paid)) {
    return false;
  }
  return IsDecision(to);
}

// Only pending tasks accept edits to quantity/type/note, or deletion.
constexpr bool IsEditable(TaskStatus status, bool paid) {
  return status == TaskStatus::kPending && !paid;
}

}  // namespace piecework::model
