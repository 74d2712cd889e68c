#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_recorder.hpp"
#include "internal/core/actor.hpp"
#include "internal/core/rate_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/types.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::core {

struct Decision {
  std::string       task_id;
  model::TaskStatus status = model::TaskStatus::kPending;
  util::Decimal     settled_pay;
};

struct BulkDecisionResult {
  std::size_t updated = 0;
  std::size_t skipped = 0;
};

/*
  ApprovalManager

  Moves work tasks between pending, approved and rejected, fixing settled_pay
  at decision time: quantity x effective rate, rounded half-up to the currency
  minor unit (zero when rejected).

  Preconditions, checked in this order inside one transaction:
    task exists            -> NotFound
    day open               -> Conflict
    task unpaid            -> Conflict
    supervisor logged day  -> Forbidden
    status is a decision   -> Validation
*/
class ApprovalManager {
 public:
  ApprovalManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<RateResolver> rates,
                  std::shared_ptr<audit::AuditRecorder> audit, int currency_places);

  Decision Decide(const std::string& task_id, model::TaskStatus new_status, const std::optional<std::string>& reason,
                  const Actor& actor);

  // Each task in its own transaction. NotFound/Conflict/Forbidden count as
  // skipped; storage failures propagate.
  BulkDecisionResult BulkDecide(const std::vector<std::string>& task_ids, model::TaskStatus new_status,
                                const std::optional<std::string>& reason, const Actor& actor);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<RateResolver>         rates_;
  std::shared_ptr<audit::AuditRecorder> audit_;
  int                                   currency_places_;
};

} // namespace piecework::core
