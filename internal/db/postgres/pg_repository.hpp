#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace piecework::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&, const WorkerFilter&) override;
  Result PatchWorker(Transaction&, const std::string&, const WorkerPatch&) override;

  Result UpsertTaskType(Transaction&, const model::TaskTypeRecord&) override;
  std::optional<model::TaskTypeRecord> GetTaskType(Transaction&, const std::string&) override;
  std::optional<model::TaskTypeRecord> GetTaskTypeByCode(Transaction&, const std::string&) override;
  std::vector<model::TaskTypeRecord> ListTaskTypes(Transaction&) override;

  Result UpsertWorkerRate(Transaction&, const model::WorkerRateRecord&) override;
  std::optional<model::WorkerRateRecord> GetWorkerRate(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::WorkerRateRecord> ListWorkerRates(Transaction&, const std::string&) override;
  Result DeleteWorkerRate(Transaction&, const std::string&, const std::string&) override;

  Result InsertWorkDayIfAbsent(Transaction&, model::WorkDayRecord&) override;
  std::optional<model::WorkDayRecord> GetWorkDay(Transaction&, const std::string&) override;
  std::vector<model::WorkDayRecord> ListWorkDays(Transaction&, const std::string&, std::optional<util::Date>,
                                                 std::optional<util::Date>) override;
  Result UpdateWorkDayNote(Transaction&, const std::string&, const std::optional<std::string>&) override;
  Result SetWorkDayClosed(Transaction&, const std::string&, bool, const std::optional<std::string>&,
                          std::optional<uint64_t>) override;

  Result InsertWorkTaskIfAbsent(Transaction&, const model::WorkTaskRecord&) override;
  std::optional<model::WorkTaskRecord> GetWorkTask(Transaction&, const std::string&) override;
  std::vector<model::WorkTaskRecord> ListTasksForDay(Transaction&, const std::string&) override;
  std::vector<PendingTaskRow> ListPendingTasks(Transaction&, const PendingTaskFilter&) override;
  Result PatchWorkTask(Transaction&, const std::string&, const WorkTaskPatch&, const std::string&, uint64_t) override;
  Result DeleteWorkTask(Transaction&, const std::string&) override;
  Result RecordDecision(Transaction&, const std::string&, const TaskDecision&) override;
  std::vector<EligibleTaskRow> ListEligibleTasks(Transaction&, const std::string&, util::Date, util::Date) override;
  Result ClaimTaskForRun(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result InsertPayrollRun(Transaction&, const model::PayrollRunRecord&) override;
  std::optional<model::PayrollRunRecord> GetPayrollRun(Transaction&, const std::string&) override;
  std::vector<model::PayrollRunRecord> ListPayrollRuns(Transaction&, std::size_t) override;
  Result InsertRunItemIfAbsent(Transaction&, const model::PayrollRunItemRecord&) override;
  std::vector<model::PayrollRunItemRecord> ListRunItems(Transaction&, const std::string&) override;

private:
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace piecework::db::postgres
