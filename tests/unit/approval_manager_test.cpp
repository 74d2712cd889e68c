#include <cassert>
#include <functional>
#include <iostream>

#include "internal/util/errors.hpp"
#include "support/fixture.hpp"

namespace {

using namespace piecework;
using piecework::model::TaskStatus;
using piecework::testing::Dec;
using piecework::testing::Fixture;
using piecework::testing::Throws;

// Lands a competing write inside the decision's transaction, after Decide
// has read the task and before its decision write, as an interleaved commit
// from another session would on a read-committed backend.
class InterleavingRepository final : public db::memory::MemoryRepository {
 public:
  db::Result RecordDecision(db::Transaction& tx, const std::string& task_id, const db::TaskDecision& decision) override {
    if (interleave) {
      auto competing = std::move(interleave);
      interleave     = nullptr;
      competing(tx, task_id);
    }
    return MemoryRepository::RecordDecision(tx, task_id, decision);
  }

  std::function<void(db::Transaction&, const std::string&)> interleave;
};

void TestApprovalFixesPayWithHalfUpRounding() {
  Fixture f;
  const auto worker = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "100.00", model::RubricCategory::kPrimary);
  const auto task    = f.AddTask(f.OpenDay(worker, "2024-01-02"), combing, "3.335");

  const auto decision = f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.supervisor);
  assert(decision.status == TaskStatus::kApproved);
  assert(decision.settled_pay == Dec("333.50"));

  const auto stored = f.Task(task);
  assert(stored.status == TaskStatus::kApproved);
  assert(stored.settled_pay == Dec("333.50"));
  assert(stored.decided_by == std::optional<std::string>("sup-1"));
  assert(f.audit->Count("TASK_APPROVE") == 1);
}

void TestWorkerOverrideWinsOverDefault() {
  Fixture f;
  const auto worker = f.AddWorker("Ana");
  const auto weaving = f.AddTaskType("WEAVING", "2.00", model::RubricCategory::kSecondary);
  f.app.roster->SetWorkerRate(worker, weaving, Dec("2.50"), f.admin);

  const auto task     = f.AddTask(f.OpenDay(worker, "2024-01-02"), weaving, "30");
  const auto decision = f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin);
  assert(decision.settled_pay == Dec("75.00"));
}

void TestRedecideIsIdempotentOnPay() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "12.345");
  const auto task    = f.AddTask(f.OpenDay(worker, "2024-01-02"), combing, "1.5");

  const auto once = f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin);

  const auto rejected = f.app.approvals->Decide(task, TaskStatus::kRejected, std::string("wrong count"), f.admin);
  assert(rejected.settled_pay.IsZero());
  assert(f.Task(task).decision_reason == std::optional<std::string>("wrong count"));

  const auto again = f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin);
  assert(again.settled_pay == once.settled_pay);
  assert(f.Task(task).settled_pay == Dec("18.52"));
}

void TestRateChangeDoesNotRepriceApprovedWork() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto task    = f.AddTask(f.OpenDay(worker, "2024-01-02"), combing, "2");
  f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin);

  f.AddTaskType("COMBING", "20");
  assert(f.Task(task).settled_pay == Dec("20.00"));
}

void TestPreconditions() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto day     = f.OpenDay(worker, "2024-01-02");
  const auto task    = f.AddTask(day, combing, "1");

  assert(Throws<util::NotFound>([&] { f.app.approvals->Decide("missing", TaskStatus::kApproved, std::nullopt, f.admin); }));
  assert(Throws<util::Validation>([&] { f.app.approvals->Decide(task, TaskStatus::kPending, std::nullopt, f.admin); }));

  core::Actor other = core::SupervisorActor{"sup-2", std::nullopt};
  assert(Throws<util::Forbidden>([&] { f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, other); }));

  f.app.work_log->CloseDay(day, f.supervisor);
  assert(Throws<util::Conflict>([&] { f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin); }));
  assert(f.Task(task).status == TaskStatus::kPending);
}

void TestPaidTaskRejectsAnyDecision() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto task    = f.ApprovedTask(worker, "2024-01-02", combing, "1");

  const auto run = f.app.settlement->CreateRun(testing::D("2024-01-03"), std::nullopt, f.admin);
  assert(run.items.size() == 1);

  assert(Throws<util::Conflict>([&] { f.app.approvals->Decide(task, TaskStatus::kRejected, std::nullopt, f.admin); }));
  assert(Throws<util::Conflict>([&] { f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin); }));

  const auto stored = f.Task(task);
  assert(stored.status == TaskStatus::kApproved);
  assert(stored.paid_run_id == std::optional<std::string>(run.run_id));
}

void TestBulkDecideSkipsDomainFailures() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto open    = f.OpenDay(worker, "2024-01-02");
  const auto closed  = f.OpenDay(worker, "2024-01-03");

  const auto a = f.AddTask(open, combing, "1");
  const auto b = f.AddTask(open, combing, "2");
  const auto c = f.AddTask(closed, combing, "3");
  f.app.work_log->CloseDay(closed, f.admin);

  const auto result =
      f.app.approvals->BulkDecide({a, b, c, "missing"}, TaskStatus::kApproved, std::string("batch"), f.supervisor);
  assert(result.updated == 2);
  assert(result.skipped == 2);
  assert(f.Task(a).status == TaskStatus::kApproved);
  assert(f.Task(c).status == TaskStatus::kPending);

  const auto empty = f.app.approvals->BulkDecide({}, TaskStatus::kRejected, std::nullopt, f.admin);
  assert(empty.updated == 0 && empty.skipped == 0);

  assert(Throws<util::Validation>([&] { f.app.approvals->BulkDecide({a}, TaskStatus::kPending, std::nullopt, f.admin); }));
}

void TestBulkDecideSkipsOtherSupervisorsDays() {
  Fixture f;
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto mine    = f.AddTask(f.OpenDay(worker, "2024-01-02"), combing, "1");

  core::Actor other = core::SupervisorActor{"sup-2", std::nullopt};
  const auto  theirs_day = f.app.work_log->UpsertWorkDay(worker, testing::D("2024-01-04"), std::nullopt, other);
  core::NewTask input;
  input.work_day_id  = theirs_day;
  input.task_type_id = combing;
  input.quantity     = Dec("1");
  const auto theirs  = f.app.work_log->AddTask(input, other);

  const auto result = f.app.approvals->BulkDecide({mine, theirs}, TaskStatus::kApproved, std::nullopt, f.supervisor);
  assert(result.updated == 1);
  assert(result.skipped == 1);
  assert(f.Task(theirs).status == TaskStatus::kPending);
}

void TestDecisionLosesToInterleavedEdit() {
  auto       repository = std::make_shared<InterleavingRepository>();
  Fixture    f(repository);
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10", model::RubricCategory::kPrimary);
  const auto task    = f.AddTask(f.OpenDay(worker, "2024-01-02"), combing, "5");

  repository->interleave = [&](db::Transaction& tx, const std::string& id) {
    db::WorkTaskPatch patch;
    patch.quantity = Dec("10");
    assert(repository->PatchWorkTask(tx, id, patch, "sup-1", 1));
  };
  assert(Throws<util::Conflict>([&] { f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin); }));

  // the edit shared the rolled-back transaction, so a retry prices the stored quantity
  auto stored = f.Task(task);
  assert(stored.status == TaskStatus::kPending);
  assert(stored.settled_pay.IsZero());

  const auto decision = f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin);
  assert(decision.settled_pay == Dec("50.00"));
  assert(f.Task(task).settled_pay == Dec("50.00"));
}

void TestDecisionLosesToInterleavedClose() {
  auto       repository = std::make_shared<InterleavingRepository>();
  Fixture    f(repository);
  const auto worker  = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10", model::RubricCategory::kPrimary);
  const auto day     = f.OpenDay(worker, "2024-01-02");
  const auto task    = f.AddTask(day, combing, "5");

  repository->interleave = [&](db::Transaction& tx, const std::string&) {
    assert(repository->SetWorkDayClosed(tx, day, true, std::string("sup-1"), 1));
  };
  assert(Throws<util::Conflict>([&] { f.app.approvals->Decide(task, TaskStatus::kApproved, std::nullopt, f.admin); }));
  assert(f.Task(task).status == TaskStatus::kPending);
  assert(f.audit->Count("TASK_APPROVE") == 0);
}

} // namespace

int main() {
  TestApprovalFixesPayWithHalfUpRounding();
  TestWorkerOverrideWinsOverDefault();
  TestRedecideIsIdempotentOnPay();
  TestRateChangeDoesNotRepriceApprovedWork();
  TestPreconditions();
  TestPaidTaskRejectsAnyDecision();
  TestBulkDecideSkipsDomainFailures();
  TestBulkDecideSkipsOtherSupervisorsDays();
  TestDecisionLosesToInterleavedEdit();
  TestDecisionLosesToInterleavedClose();

  std::cout << "piecework_unit_approval_manager: pass\n";
  return 0;
}
