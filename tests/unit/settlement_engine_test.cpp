#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <thread>

#include "internal/util/errors.hpp"
#include "support/fixture.hpp"

namespace {

using namespace piecework;
using piecework::model::PayoutFrequency;
using piecework::model::TaskStatus;
using piecework::testing::D;
using piecework::testing::Dec;
using piecework::testing::Fixture;
using piecework::testing::Throws;

// Loses the claim race for one chosen task.
class LosingClaimRepository final : public db::memory::MemoryRepository {
 public:
  db::Result ClaimTaskForRun(db::Transaction& tx, const std::string& task_id, const std::string& run_id,
                             uint64_t paid_at_ms) override {
    if (task_id == contested_task) {
      return db::Result::Err(db::ErrorCode::Conflict, "claimed elsewhere");
    }
    return MemoryRepository::ClaimTaskForRun(tx, task_id, run_id, paid_at_ms);
  }

  std::string contested_task;
};

void TestRunSettlesEachTaskExactlyOnce() {
  Fixture f;
  const auto ana     = f.AddWorker("Ana");
  const auto ben     = f.AddWorker("Ben");
  const auto combing = f.AddTaskType("COMBING", "100", model::RubricCategory::kPrimary);
  const auto weaving = f.AddTaskType("WEAVING", "0.5", model::RubricCategory::kSecondary);

  const auto t1 = f.ApprovedTask(ana, "2024-01-02", combing, "1.25");
  const auto t2 = f.ApprovedTask(ana, "2024-01-02", weaving, "30");
  const auto unapproved = f.AddTask(f.OpenDay(ana, "2024-01-02"), weaving, "15");
  const auto rejected = f.AddTask(f.OpenDay(ben, "2024-01-03"), combing, "5");
  f.app.approvals->Decide(rejected, TaskStatus::kRejected, std::nullopt, f.admin);

  const auto first = f.app.settlement->CreateRun(D("2024-01-04"), std::string("week 1"), f.admin);
  assert(first.failed_workers.empty());
  assert(first.items.size() == 1);

  const auto& item = first.items[0];
  assert(item.worker_id == ana);
  assert(item.total_pay == Dec("140.00"));
  assert(item.primary_quantity == Dec("1.25"));
  assert(item.secondary_quantity == Dec("30"));
  assert(item.task_count == 2);
  assert(item.period_start == D("2024-01-01"));
  assert(item.period_end == D("2024-01-04"));

  assert(f.Task(t1).paid_run_id == std::optional<std::string>(first.run_id));
  assert(f.Task(t2).paid_run_id == std::optional<std::string>(first.run_id));
  assert(!f.Task(rejected).paid_run_id.has_value());
  assert(!f.Task(unapproved).paid_run_id.has_value());

  const auto second = f.app.settlement->CreateRun(D("2024-01-04"), std::nullopt, f.admin);
  assert(second.items.empty());
  assert(f.Task(t1).paid_run_id == std::optional<std::string>(first.run_id));

  const auto detail = f.app.settlement->GetRun(first.run_id);
  assert(detail.run.note == std::optional<std::string>("week 1"));
  assert(detail.run.created_by == "admin-1");
  assert(detail.items.size() == 1);
  assert(f.app.settlement->GetRun(second.run_id).items.empty());
  assert(f.audit->Count("PAYROLL_RUN_CREATE") == 2);
}

void TestRunNeverIncludesWorkAfterAsOf() {
  Fixture f;
  const auto ana     = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10");

  const auto early = f.ApprovedTask(ana, "2024-01-02", combing, "1");
  const auto late  = f.ApprovedTask(ana, "2024-01-06", combing, "1");

  const auto run = f.app.settlement->CreateRun(D("2024-01-03"), std::nullopt, f.admin);
  assert(run.items.size() == 1);
  assert(run.items[0].total_pay == Dec("10.00"));
  assert(f.Task(early).IsPaid());
  assert(!f.Task(late).IsPaid());

  // the later task is picked up by the next run inside the same period
  const auto next = f.app.settlement->CreateRun(D("2024-01-07"), std::nullopt, f.admin);
  assert(next.items.size() == 1);
  assert(f.Task(late).paid_run_id == std::optional<std::string>(next.run_id));
}

void TestRunSkipsWorkersNotYetStarted() {
  Fixture f;
  const auto cem     = f.AddWorker("Cem", PayoutFrequency::kWeekly, "2024-02-01");
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto task    = f.ApprovedTask(cem, "2024-02-02", combing, "1");

  const auto run = f.app.settlement->CreateRun(D("2024-01-20"), std::nullopt, f.admin);
  assert(run.items.empty());
  assert(run.failed_workers.empty());
  assert(!f.Task(task).IsPaid());
}

void TestConcurrentRunsNeverDoubleClaim() {
  Fixture f;
  const auto combing = f.AddTaskType("COMBING", "10");

  std::vector<std::string> tasks;
  for (int w = 0; w < 6; ++w) {
    const auto worker = f.AddWorker("Worker " + std::to_string(w));
    for (const char* date : {"2024-01-02", "2024-01-03", "2024-01-04"}) {
      tasks.push_back(f.ApprovedTask(worker, date, combing, "1"));
    }
  }

  std::vector<core::RunSummary> summaries(4);
  std::vector<std::thread>      threads;
  for (std::size_t i = 0; i < summaries.size(); ++i) {
    threads.emplace_back([&, i] { summaries[i] = f.app.settlement->CreateRun(D("2024-01-05"), std::nullopt, f.admin); });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::size_t           claimed = 0;
  std::set<std::string> workers;
  for (const auto& summary : summaries) {
    assert(summary.failed_workers.empty());
    for (const auto& item : summary.items) {
      claimed += item.task_count;
      // a worker is settled by exactly one run
      assert(workers.insert(item.worker_id).second);
      assert(item.total_pay == Dec("30.00"));
    }
  }
  assert(claimed == tasks.size());
  assert(workers.size() == 6);

  for (const auto& task : tasks) {
    assert(f.Task(task).IsPaid());
  }
}

void TestFailedClaimRollsBackOnlyThatWorker() {
  auto repository = std::make_shared<LosingClaimRepository>();
  Fixture f(repository);
  const auto ana     = f.AddWorker("Ana");
  const auto ben     = f.AddWorker("Ben");
  const auto combing = f.AddTaskType("COMBING", "10");

  const auto ana_first  = f.ApprovedTask(ana, "2024-01-02", combing, "1");
  const auto ana_second = f.ApprovedTask(ana, "2024-01-03", combing, "1");
  const auto ben_task   = f.ApprovedTask(ben, "2024-01-02", combing, "2");
  repository->contested_task = std::max(ana_first, ana_second);

  const auto run = f.app.settlement->CreateRun(D("2024-01-04"), std::nullopt, f.admin);
  assert(run.failed_workers.size() == 1);
  assert(run.failed_workers[0] == ana);
  assert(run.items.size() == 1);
  assert(run.items[0].worker_id == ben);

  // nothing of Ana's was applied: no item, no claimed task
  assert(!f.Task(ana_first).IsPaid());
  assert(!f.Task(ana_second).IsPaid());
  assert(f.Task(ben_task).IsPaid());
  assert(f.app.settlement->GetRun(run.run_id).items.size() == 1);
}

void TestPayrollDueOnlyForEndedPeriods() {
  Fixture f;
  const auto combing = f.AddTaskType("COMBING", "10");
  const auto weekly  = f.AddWorker("Ana", PayoutFrequency::kWeekly, "2024-01-01", std::string("f-1"));
  const auto monthly = f.AddWorker("Ben", PayoutFrequency::kMonthly, "2024-01-01", std::string("f-2"));
  const auto idle    = f.AddWorker("Cem", PayoutFrequency::kWeekly, "2024-01-01", std::string("f-1"));
  (void)idle;

  f.ApprovedTask(weekly, "2024-01-02", combing, "1");
  f.ApprovedTask(monthly, "2024-01-02", combing, "3");
  f.AddTask(f.OpenDay(weekly, "2024-01-03"), combing, "9");

  // 2024-01-07 closes Ana's first week but not Ben's month
  auto due = f.app.settlement->PayrollDue(D("2024-01-07"), f.admin);
  assert(due.size() == 1);
  assert(due[0].worker_id == weekly);
  assert(due[0].total_pay == Dec("10.00"));
  assert(due[0].task_count == 1);
  assert((due[0].period == core::Period{D("2024-01-01"), D("2024-01-07")}));

  assert(f.app.settlement->PayrollDue(D("2024-01-06"), f.admin).empty());

  due = f.app.settlement->PayrollDue(D("2024-01-31"), f.admin);
  assert(due.size() == 1);
  assert(due[0].worker_id == monthly);

  core::Actor scoped = core::SupervisorActor{"sup-9", std::string("f-2")};
  assert(f.app.settlement->PayrollDue(D("2024-01-07"), scoped).empty());
  assert(f.app.settlement->PayrollDue(D("2024-01-31"), scoped).size() == 1);
}

void TestWorkerPayrollIsReadOnly() {
  Fixture f;
  const auto ana     = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "10", model::RubricCategory::kPrimary);
  const auto task    = f.ApprovedTask(ana, "2024-01-02", combing, "2");

  const auto line = f.app.settlement->WorkerPayroll(ana, D("2024-01-03"));
  assert((line.period == core::Period{D("2024-01-01"), D("2024-01-03")}));
  assert(line.total_pay == Dec("20.00"));
  assert(line.primary_quantity == Dec("2"));
  assert(!f.Task(task).IsPaid());

  assert(Throws<util::NotFound>([&] { f.app.settlement->WorkerPayroll("missing", D("2024-01-03")); }));
}

void TestListRunsClampsLimit() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    f.app.settlement->CreateRun(D("2024-01-04"), std::nullopt, f.admin);
  }
  assert(f.app.settlement->ListRuns(0).size() == 1);
  assert(f.app.settlement->ListRuns(2).size() == 2);
  assert(f.app.settlement->ListRuns().size() == 3);
  assert(Throws<util::NotFound>([&] { f.app.settlement->GetRun("missing"); }));
}

void TestCurrencyPlacesFromConfig() {
  piecework::runtime::config::RuntimeConfig config;
  config.mutable_settlement()->set_currency_places(0);
  Fixture f(std::make_shared<db::memory::MemoryRepository>(), config);

  const auto ana     = f.AddWorker("Ana");
  const auto combing = f.AddTaskType("COMBING", "100");
  const auto task    = f.ApprovedTask(ana, "2024-01-02", combing, "3.335");
  assert(f.Task(task).settled_pay == Dec("334"));

  config.mutable_settlement()->set_currency_places(5);
  assert(Throws<util::Validation>([&] { Fixture bad(std::make_shared<db::memory::MemoryRepository>(), config); }));
}

} // namespace

int main() {
  TestRunSettlesEachTaskExactlyOnce();
  TestRunNeverIncludesWorkAfterAsOf();
  TestRunSkipsWorkersNotYetStarted();
  TestConcurrentRunsNeverDoubleClaim();
  TestFailedClaimRollsBackOnlyThatWorker();
  TestPayrollDueOnlyForEndedPeriods();
  TestWorkerPayrollIsReadOnly();
  TestListRunsClampsLimit();
  TestCurrencyPlacesFromConfig();

  std::cout << "piecework_unit_settlement_engine: pass\n";
  return 0;
}
