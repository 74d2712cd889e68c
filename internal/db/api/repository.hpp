#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/payroll_run_record.hpp"
#include "internal/db/model/task_type_record.hpp"
#include "internal/db/model/work_day_record.hpp"
#include "internal/db/model/work_task_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace piecework::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (RecordDecision, PatchWorkTask, DeleteWorkTask,
    ClaimTaskForRun) evaluate their guard and apply in one statement
  - A task is claimed by at most one payroll run

  The DB is the source of truth for:
    roster (workers, task types, rates)
    work days and tasks
    payroll runs and their items
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  // AlreadyExists on duplicate id, ConstraintViolation on duplicate worker_code.
  virtual Result InsertWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  // Ordered by full_name.
  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&, const WorkerFilter&) = 0;

  virtual Result PatchWorker(Transaction&, const std::string& id, const WorkerPatch&) = 0;

  // ---------------------------------------------------------------------
  // Task types and rates
  // ---------------------------------------------------------------------

  // Keyed by id; ConstraintViolation if another type already owns the code.
  virtual Result UpsertTaskType(Transaction&, const model::TaskTypeRecord&) = 0;

  virtual std::optional<model::TaskTypeRecord> GetTaskType(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::TaskTypeRecord> GetTaskTypeByCode(Transaction&, const std::string& code) = 0;

  // Ordered by code.
  virtual std::vector<model::TaskTypeRecord> ListTaskTypes(Transaction&) = 0;

  virtual Result UpsertWorkerRate(Transaction&, const model::WorkerRateRecord&) = 0;

  virtual std::optional<model::WorkerRateRecord> GetWorkerRate(Transaction&, const std::string& worker_id,
                                                               const std::string& task_type_id) = 0;

  virtual std::vector<model::WorkerRateRecord> ListWorkerRates(Transaction&, const std::string& worker_id) = 0;

  virtual Result DeleteWorkerRate(Transaction&, const std::string& worker_id, const std::string& task_type_id) = 0;

  // ---------------------------------------------------------------------
  // Work days
  // ---------------------------------------------------------------------

  // Inserts unless (worker_id, work_date) exists. On AlreadyExists the record
  // is overwritten with the stored row.
  virtual Result InsertWorkDayIfAbsent(Transaction&, model::WorkDayRecord&) = 0;

  virtual std::optional<model::WorkDayRecord> GetWorkDay(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::WorkDayRecord> ListWorkDays(Transaction&, const std::string& worker_id,
                                                         std::optional<util::Date> start,
                                                         std::optional<util::Date> end) = 0;

  virtual Result UpdateWorkDayNote(Transaction&, const std::string& id, const std::optional<std::string>& note) = 0;

  // closed_by / closed_at_ms are cleared when reopening.
  virtual Result SetWorkDayClosed(Transaction&, const std::string& id, bool closed,
                                  const std::optional<std::string>& closed_by,
                                  std::optional<uint64_t>           closed_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Work tasks
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken; callers treat that as a replay.
  virtual Result InsertWorkTaskIfAbsent(Transaction&, const model::WorkTaskRecord&) = 0;

  virtual std::optional<model::WorkTaskRecord> GetWorkTask(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms.
  virtual std::vector<model::WorkTaskRecord> ListTasksForDay(Transaction&, const std::string& work_day_id) = 0;

  // Newest day first, then creation order.
  virtual std::vector<PendingTaskRow> ListPendingTasks(Transaction&, const PendingTaskFilter&) = 0;

  // Applied only while pending and unpaid; Conflict otherwise.
  virtual Result PatchWorkTask(Transaction&, const std::string& id, const WorkTaskPatch&,
                               const std::string& updated_by, uint64_t updated_at_ms) = 0;

  // Applied only while pending and unpaid; Conflict otherwise.
  virtual Result DeleteWorkTask(Transaction&, const std::string& id) = 0;

  // Applied only while unpaid, on an open day, and matching the decision's
  // expected quantity/type; Conflict otherwise.
  virtual Result RecordDecision(Transaction&, const std::string& id, const TaskDecision&) = 0;

  // Approved, unpaid tasks of one worker with work_date in [start, end].
  // Backends lock the returned rows until the transaction ends.
  virtual std::vector<EligibleTaskRow> ListEligibleTasks(Transaction&, const std::string& worker_id, util::Date start,
                                                         util::Date end) = 0;

  // Compare-and-set: sets paid_run_id only if it is still null and the task is
  // approved. Conflict when another run got there first.
  virtual Result ClaimTaskForRun(Transaction&, const std::string& task_id, const std::string& run_id,
                                 uint64_t paid_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Payroll runs
  // ---------------------------------------------------------------------

  virtual Result InsertPayrollRun(Transaction&, const model::PayrollRunRecord&) = 0;

  virtual std::optional<model::PayrollRunRecord> GetPayrollRun(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::PayrollRunRecord> ListPayrollRuns(Transaction&, std::size_t limit) = 0;

  // AlreadyExists when (run_id, worker_id) is taken.
  virtual Result InsertRunItemIfAbsent(Transaction&, const model::PayrollRunItemRecord&) = 0;

  // Ordered by worker_name.
  virtual std::vector<model::PayrollRunItemRecord> ListRunItems(Transaction&, const std::string& run_id) = 0;
};

} // namespace piecework::db
