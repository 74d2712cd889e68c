#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_recorder.hpp"
#include "internal/core/actor.hpp"
#include "internal/core/period_calculator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::core {

// Approved, unpaid totals of one worker over one period.
struct PayrollLine {
  std::string                worker_id;
  std::string                worker_name;
  std::optional<std::string> factory_id;
  model::PayoutFrequency     payout = model::PayoutFrequency::kWeekly;
  Period                     period;
  util::Decimal              total_pay;
  util::Decimal              primary_quantity;
  util::Decimal              secondary_quantity;
  uint32_t                   task_count = 0;
};

struct RunSummary {
  std::string                                    run_id;
  std::vector<db::model::PayrollRunItemRecord>   items;
  // workers whose claims were rolled back; none of their tasks were settled
  std::vector<std::string>                       failed_workers;
};

struct RunDetail {
  db::model::PayrollRunRecord                  run;
  std::vector<db::model::PayrollRunItemRecord> items;
};

/*
  SettlementEngine

  Turns approved work into immutable payroll snapshots.

  IMPORTANT:
  - A task is settled at most once. Each worker is settled in its own
    transaction; the claim is a compare-and-set on paid_run_id, and a failed
    claim rolls back every write for that worker.
  - Runs settle the period so far (CurrentProgressPeriod), so work dated after
    as_of is never included.
  - PayrollDue and WorkerPayroll are read-only.
*/
class SettlementEngine {
 public:
  static constexpr std::size_t kDefaultRunLimit = 50;
  static constexpr std::size_t kMaxRunLimit     = 200;

  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<audit::AuditRecorder> audit,
                   int currency_places);

  RunSummary CreateRun(util::Date as_of, const std::optional<std::string>& note, const Actor& actor);

  // Workers whose full settlement period ended on or before as_of and still
  // hold unpaid approved work. Supervisors bound to a factory see only it.
  std::vector<PayrollLine> PayrollDue(util::Date as_of, const Actor& actor);

  // Live view of the current period up to as_of.
  PayrollLine WorkerPayroll(const std::string& worker_id, util::Date as_of);

  // Newest first; limit clamped to [1, kMaxRunLimit].
  std::vector<db::model::PayrollRunRecord> ListRuns(std::size_t limit = kDefaultRunLimit);
  RunDetail                                GetRun(const std::string& run_id);

 private:
  PayrollLine Aggregate(db::Transaction& tx, const db::model::WorkerRecord& worker, const Period& period,
                        std::vector<db::EligibleTaskRow>* rows);

  // Returns the item written, or nothing when the worker had no eligible work.
  std::optional<db::model::PayrollRunItemRecord> SettleWorker(const std::string& run_id, util::Date as_of,
                                                              const db::model::WorkerRecord& worker);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<audit::AuditRecorder> audit_;
  int                                   currency_places_;
};

} // namespace piecework::core
