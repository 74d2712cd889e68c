#include "internal/core/settlement_engine.hpp"

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace piecework::core {

using observability::IntField;
using observability::StringField;

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<audit::AuditRecorder> audit,
                                   int currency_places)
    : repository_(std::move(repository)), audit_(std::move(audit)), currency_places_(currency_places) {
}

PayrollLine SettlementEngine::Aggregate(db::Transaction& tx, const db::model::WorkerRecord& worker, const Period& period,
                                        std::vector<db::EligibleTaskRow>* rows) {
  PayrollLine line;
  line.worker_id   = worker.id;
  line.worker_name = worker.full_name;
  line.factory_id  = worker.factory_id;
  line.payout      = worker.payout;
  line.period      = period;

  auto eligible = repository_->ListEligibleTasks(tx, worker.id, period.start, period.end);
  for (const auto& row : eligible) {
    line.total_pay += row.settled_pay;
    if (row.category == model::RubricCategory::kPrimary) {
      line.primary_quantity += row.quantity;
    } else if (row.category == model::RubricCategory::kSecondary) {
      line.secondary_quantity += row.quantity;
    }
  }
  line.total_pay  = line.total_pay.RoundHalfUp(currency_places_);
  line.task_count = static_cast<uint32_t>(eligible.size());

  if (rows) {
    *rows = std::move(eligible);
  }
  return line;
}

std::optional<db::model::PayrollRunItemRecord> SettlementEngine::SettleWorker(const std::string& run_id, util::Date as_of,
                                                                             const db::model::WorkerRecord& worker) {
  // no period has started yet
  if (as_of < worker.anchor_date) {
    return std::nullopt;
  }

  auto tx = repository_->Begin();

  const auto                       period = CurrentProgressPeriod(worker.payout, worker.anchor_date, as_of);
  std::vector<db::EligibleTaskRow> rows;
  const auto                       line = Aggregate(*tx, worker, period, &rows);
  if (rows.empty()) {
    return std::nullopt;
  }

  db::model::PayrollRunItemRecord item;
  item.run_id             = run_id;
  item.worker_id          = worker.id;
  item.worker_name        = worker.full_name;
  item.payout             = worker.payout;
  item.period_start       = period.start;
  item.period_end         = period.end;
  item.total_pay          = line.total_pay;
  item.primary_quantity   = line.primary_quantity;
  item.secondary_quantity = line.secondary_quantity;
  item.task_count         = line.task_count;

  const auto inserted = repository_->InsertRunItemIfAbsent(*tx, item);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    return std::nullopt;
  }
  ThrowIfDbError(inserted, "insert run item");

  const auto paid_at = util::NowMillis();
  for (const auto& row : rows) {
    ThrowIfDbError(repository_->ClaimTaskForRun(*tx, row.task_id, run_id, paid_at), "claim task " + row.task_id);
  }

  tx->Commit();
  return item;
}

RunSummary SettlementEngine::CreateRun(util::Date as_of, const std::optional<std::string>& note, const Actor& actor) {
  db::model::PayrollRunRecord run;
  run.id            = util::NewId();
  run.as_of         = as_of;
  run.created_by    = UserId(actor);
  run.note          = note;
  run.created_at_ms = util::NowMillis();

  std::vector<db::model::WorkerRecord> workers;
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertPayrollRun(*tx, run), "insert payroll run");
    workers = repository_->ListWorkers(*tx, db::WorkerFilter{});
    tx->Commit();
  }

  RunSummary summary;
  summary.run_id = run.id;

  for (const auto& worker : workers) {
    try {
      if (auto item = SettleWorker(run.id, as_of, worker)) {
        summary.items.push_back(std::move(*item));
      }
    } catch (const std::exception& e) {
      // the worker's transaction has rolled back; nothing of theirs is settled
      summary.failed_workers.push_back(worker.id);
      PIECEWORK_LOG_ERROR("worker settlement failed", {StringField("run_id", run.id), StringField("worker_id", worker.id),
                                                       StringField("error", e.what())});
    }
  }

  std::sort(summary.items.begin(), summary.items.end(),
            [](const auto& a, const auto& b) { return a.worker_name < b.worker_name; });

  PIECEWORK_LOG_INFO("payroll run created", {StringField("run_id", run.id), StringField("as_of", util::FormatIsoDate(as_of)),
                                             IntField("items", static_cast<int64_t>(summary.items.size())),
                                             IntField("failed", static_cast<int64_t>(summary.failed_workers.size()))});

  auto event = audit::NewEvent(actor, "PAYROLL_RUN_CREATE", "payroll_run", run.id);
  audit::SetString(event, "as_of", util::FormatIsoDate(as_of));
  audit::SetNumber(event, "items", static_cast<int64_t>(summary.items.size()));
  audit::SetNumber(event, "failed_workers", static_cast<int64_t>(summary.failed_workers.size()));
  audit::Emit(audit_.get(), std::move(event));

  return summary;
}

std::vector<PayrollLine> SettlementEngine::PayrollDue(util::Date as_of, const Actor& actor) {
  db::WorkerFilter filter;
  if (const auto* supervisor = std::get_if<SupervisorActor>(&actor)) {
    filter.factory_id = supervisor->factory_id;
  }

  auto tx      = repository_->Begin();
  auto workers = repository_->ListWorkers(*tx, filter);

  std::vector<PayrollLine> due;
  for (const auto& worker : workers) {
    const auto period = SettlementPeriod(worker.payout, worker.anchor_date, as_of);
    if (period.end > as_of) {
      continue;
    }
    auto line = Aggregate(*tx, worker, period, nullptr);
    if (line.total_pay > util::Decimal{}) {
      due.push_back(std::move(line));
    }
  }
  tx->Commit();
  return due;
}

PayrollLine SettlementEngine::WorkerPayroll(const std::string& worker_id, util::Date as_of) {
  auto tx     = repository_->Begin();
  auto worker = repository_->GetWorker(*tx, worker_id);
  if (!worker) {
    throw util::NotFound("worker not found: " + worker_id);
  }
  auto line = Aggregate(*tx, *worker, CurrentProgressPeriod(worker->payout, worker->anchor_date, as_of), nullptr);
  tx->Commit();
  return line;
}

std::vector<db::model::PayrollRunRecord> SettlementEngine::ListRuns(std::size_t limit) {
  limit = std::clamp<std::size_t>(limit, 1, kMaxRunLimit);

  auto tx   = repository_->Begin();
  auto runs = repository_->ListPayrollRuns(*tx, limit);
  tx->Commit();
  return runs;
}

RunDetail SettlementEngine::GetRun(const std::string& run_id) {
  auto tx  = repository_->Begin();
  auto run = repository_->GetPayrollRun(*tx, run_id);
  if (!run) {
    throw util::NotFound("payroll run not found: " + run_id);
  }
  RunDetail detail{std::move(*run), repository_->ListRunItems(*tx, run_id)};
  tx->Commit();
  return detail;
}

} // namespace piecework::core
