#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/uuid.hpp"

namespace {

using piecework::db::ErrorCode;
using piecework::db::Repository;
using piecework::db::TaskDecision;
using piecework::db::WorkerFilter;
using piecework::db::WorkerPatch;
using piecework::db::WorkTaskPatch;
using piecework::db::memory::MemoryRepository;
using piecework::db::model::PayrollRunItemRecord;
using piecework::db::model::PayrollRunRecord;
using piecework::db::model::TaskTypeRecord;
using piecework::db::model::WorkDayRecord;
using piecework::db::model::WorkerRateRecord;
using piecework::db::model::WorkerRecord;
using piecework::db::model::WorkTaskRecord;
using piecework::model::PayoutFrequency;
using piecework::model::RubricCategory;
using piecework::model::TaskStatus;
using piecework::runtime::config::RuntimeConfig;
using piecework::util::Decimal;
using piecework::util::NewId;
using piecework::util::ParseIsoDate;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Fresh ids per call so persistent backends can be reused between runs.
struct Seed {
  std::string worker_id;
  std::string task_type_id;
  std::string day_id;
};

WorkerRecord MakeWorker(const std::string& name) {
  return WorkerRecord{.id            = NewId(),
                      .worker_code   = "W-" + NewId().substr(0, 8),
                      .full_name     = name,
                      .factory_id    = std::string("mill-1"),
                      .payout        = PayoutFrequency::kWeekly,
                      .anchor_date   = ParseIsoDate("2024-01-01"),
                      .active        = true,
                      .created_at_ms = NowMs()};
}

TaskTypeRecord MakeTaskType(RubricCategory category, const std::string& rate) {
  return TaskTypeRecord{.id           = NewId(),
                        .code         = "T-" + NewId().substr(0, 8),
                        .name         = "Combing",
                        .unit         = "kg",
                        .default_rate = Decimal::Parse(rate),
                        .category     = category};
}

WorkTaskRecord MakeTask(const std::string& day_id, const std::string& type_id, const std::string& quantity) {
  WorkTaskRecord task;
  task.id            = NewId();
  task.work_day_id   = day_id;
  task.task_type_id  = type_id;
  task.quantity      = Decimal::Parse(quantity);
  task.created_at_ms = NowMs();
  return task;
}

TaskDecision Approve(const std::string& pay) {
  return TaskDecision{.status        = TaskStatus::kApproved,
                      .decided_by    = "admin-1",
                      .decided_at_ms = NowMs(),
                      .reason        = std::nullopt,
                      .settled_pay   = Decimal::Parse(pay)};
}

Seed SeedWorkerDay(Repository& repo, const std::string& name, const std::string& date) {
  auto tx = repo.Begin();

  auto worker = MakeWorker(name);
  assert(repo.InsertWorker(*tx, worker));
  auto type = MakeTaskType(RubricCategory::kPrimary, "10");
  assert(repo.UpsertTaskType(*tx, type));

  WorkDayRecord day{.id = NewId(), .worker_id = worker.id, .work_date = ParseIsoDate(date), .logged_by = "sup-1"};
  day.created_at_ms = NowMs();
  assert(repo.InsertWorkDayIfAbsent(*tx, day));

  tx->Commit();
  return Seed{worker.id, type.id, day.id};
}

void VerifyRosterReadWrite(Repository& repo) {
  auto worker = MakeWorker("Zora Quill");
  auto type   = MakeTaskType(RubricCategory::kSecondary, "0.35");
  {
    auto tx = repo.Begin();
    assert(repo.InsertWorker(*tx, worker));
    assert(repo.InsertWorker(*tx, worker).code == ErrorCode::AlreadyExists);
    assert(repo.UpsertTaskType(*tx, type));
    tx->Commit();
  }

  // uniqueness clashes abort a postgres transaction, so each gets its own
  {
    auto tx    = repo.Begin();
    auto clash = MakeWorker("Other");
    clash.worker_code = worker.worker_code;
    assert(repo.InsertWorker(*tx, clash).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  {
    auto tx     = repo.Begin();
    auto stolen = MakeTaskType(RubricCategory::kNone, "1");
    stolen.code = type.code;
    assert(repo.UpsertTaskType(*tx, stolen).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  auto read = repo.GetWorker(*tx, worker.id);
  assert(read.has_value());
  assert(read->full_name == "Zora Quill");
  assert(read->worker_code == worker.worker_code);
  assert(read->anchor_date == worker.anchor_date);
  assert(read->active);

  WorkerPatch patch;
  patch.factory_id = std::optional<std::string>{};
  patch.payout     = PayoutFrequency::kMonthly;
  patch.active     = false;
  assert(repo.PatchWorker(*tx, worker.id, patch));
  assert(repo.PatchWorker(*tx, NewId(), patch).code == ErrorCode::NotFound);

  read = repo.GetWorker(*tx, worker.id);
  assert(read.has_value());
  assert(!read->factory_id.has_value());
  assert(read->payout == PayoutFrequency::kMonthly);
  assert(!read->active);

  bool listed_active = false;
  for (const auto& w : repo.ListWorkers(*tx, WorkerFilter{})) {
    listed_active = listed_active || w.id == worker.id;
  }
  assert(!listed_active);

  bool listed_all = false;
  for (const auto& w : repo.ListWorkers(*tx, WorkerFilter{.active_only = false})) {
    listed_all = listed_all || w.id == worker.id;
  }
  assert(listed_all);

  type.name         = "Weaving";
  type.default_rate = Decimal::Parse("0.40");
  assert(repo.UpsertTaskType(*tx, type));

  auto by_code = repo.GetTaskTypeByCode(*tx, type.code);
  assert(by_code.has_value());
  assert(by_code->id == type.id);
  assert(by_code->name == "Weaving");
  assert(by_code->default_rate == Decimal::Parse("0.4"));
  assert(by_code->category == RubricCategory::kSecondary);

  WorkerRateRecord rate{.worker_id = worker.id, .task_type_id = type.id, .rate = Decimal::Parse("0.55")};
  assert(repo.UpsertWorkerRate(*tx, rate));
  rate.rate = Decimal::Parse("0.6");
  assert(repo.UpsertWorkerRate(*tx, rate));

  auto read_rate = repo.GetWorkerRate(*tx, worker.id, type.id);
  assert(read_rate.has_value());
  assert(read_rate->rate == Decimal::Parse("0.6"));
  assert(repo.ListWorkerRates(*tx, worker.id).size() == 1);

  assert(repo.DeleteWorkerRate(*tx, worker.id, type.id));
  assert(repo.DeleteWorkerRate(*tx, worker.id, type.id).code == ErrorCode::NotFound);
  assert(!repo.GetWorkerRate(*tx, worker.id, type.id).has_value());

  tx->Commit();
}

void VerifyWorkDayReadWrite(Repository& repo) {
  auto seed = SeedWorkerDay(repo, "Ada Loom", "2024-03-04");

  auto tx = repo.Begin();

  // a second insert for the same date reports the stored row
  WorkDayRecord again{.id = NewId(), .worker_id = seed.worker_id, .work_date = ParseIsoDate("2024-03-04"), .logged_by = "sup-2"};
  assert(repo.InsertWorkDayIfAbsent(*tx, again).code == ErrorCode::AlreadyExists);
  assert(again.id == seed.day_id);
  assert(again.logged_by == "sup-1");

  WorkDayRecord later{.id = NewId(), .worker_id = seed.worker_id, .work_date = ParseIsoDate("2024-03-06"), .logged_by = "sup-1"};
  assert(repo.InsertWorkDayIfAbsent(*tx, later));

  const auto days = repo.ListWorkDays(*tx, seed.worker_id, std::nullopt, std::nullopt);
  assert(days.size() == 2);
  assert(days[0].id == later.id);
  assert(days[1].id == seed.day_id);

  const auto windowed = repo.ListWorkDays(*tx, seed.worker_id, ParseIsoDate("2024-03-05"), std::nullopt);
  assert(windowed.size() == 1);
  assert(windowed[0].id == later.id);

  assert(repo.UpdateWorkDayNote(*tx, seed.day_id, std::string("rain delay")));
  assert(repo.SetWorkDayClosed(*tx, seed.day_id, true, std::string("sup-1"), NowMs()));

  auto day = repo.GetWorkDay(*tx, seed.day_id);
  assert(day.has_value());
  assert(day->note == std::optional<std::string>("rain delay"));
  assert(day->closed);
  assert(day->closed_by == std::optional<std::string>("sup-1"));
  assert(day->closed_at_ms.has_value());

  assert(repo.SetWorkDayClosed(*tx, seed.day_id, false, std::nullopt, std::nullopt));
  day = repo.GetWorkDay(*tx, seed.day_id);
  assert(!day->closed);
  assert(!day->closed_by.has_value());
  assert(!day->closed_at_ms.has_value());

  assert(repo.SetWorkDayClosed(*tx, NewId(), true, std::string("sup-1"), NowMs()).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyTaskGuards(Repository& repo) {
  auto seed = SeedWorkerDay(repo, "Bea Spindle", "2024-03-05");

  auto tx = repo.Begin();

  auto task = MakeTask(seed.day_id, seed.task_type_id, "2.5");
  task.note = std::string("first bale");
  assert(repo.InsertWorkTaskIfAbsent(*tx, task));
  assert(repo.InsertWorkTaskIfAbsent(*tx, task).code == ErrorCode::AlreadyExists);

  auto pending = repo.ListPendingTasks(*tx, piecework::db::PendingTaskFilter{.worker_id = seed.worker_id});
  assert(pending.size() == 1);
  assert(pending[0].task.id == task.id);
  assert(pending[0].worker_name == "Bea Spindle");
  assert(pending[0].work_date == ParseIsoDate("2024-03-05"));

  WorkTaskPatch patch;
  patch.quantity = Decimal::Parse("3");
  patch.note     = std::optional<std::string>{};
  assert(repo.PatchWorkTask(*tx, task.id, patch, "sup-1", NowMs()));

  auto read = repo.GetWorkTask(*tx, task.id);
  assert(read.has_value());
  assert(read->quantity == Decimal::Parse("3"));
  assert(!read->note.has_value());
  assert(read->updated_by == std::optional<std::string>("sup-1"));

  assert(repo.RecordDecision(*tx, task.id, Approve("30")));
  read = repo.GetWorkTask(*tx, task.id);
  assert(read->status == TaskStatus::kApproved);
  assert(read->settled_pay == Decimal::Parse("30"));
  assert(read->decided_by == std::optional<std::string>("admin-1"));

  // decided tasks are no longer editable
  assert(repo.PatchWorkTask(*tx, task.id, patch, "sup-1", NowMs()).code == ErrorCode::Conflict);
  assert(repo.DeleteWorkTask(*tx, task.id).code == ErrorCode::Conflict);

  // once claimed, a task can be neither re-decided nor claimed again
  assert(repo.ClaimTaskForRun(*tx, task.id, "run-a", NowMs()));
  assert(repo.ClaimTaskForRun(*tx, task.id, "run-b", NowMs()).code == ErrorCode::Conflict);
  assert(repo.RecordDecision(*tx, task.id, Approve("99")).code == ErrorCode::Conflict);
  read = repo.GetWorkTask(*tx, task.id);
  assert(read->paid_run_id == std::optional<std::string>("run-a"));
  assert(read->settled_pay == Decimal::Parse("30"));

  auto doomed = MakeTask(seed.day_id, seed.task_type_id, "1");
  assert(repo.InsertWorkTaskIfAbsent(*tx, doomed));
  assert(repo.ClaimTaskForRun(*tx, doomed.id, "run-a", NowMs()).code == ErrorCode::Conflict);
  assert(repo.DeleteWorkTask(*tx, doomed.id));
  assert(!repo.GetWorkTask(*tx, doomed.id).has_value());
  assert(repo.ListTasksForDay(*tx, seed.day_id).size() == 1);

  tx->Commit();
}

void VerifyDecisionGuards(Repository& repo) {
  auto seed = SeedWorkerDay(repo, "Dov Carder", "2024-03-12");

  auto tx = repo.Begin();

  auto task = MakeTask(seed.day_id, seed.task_type_id, "5");
  assert(repo.InsertWorkTaskIfAbsent(*tx, task));

  // priced from a stale read of the quantity or type
  auto stale              = Approve("50");
  stale.expected_quantity = Decimal::Parse("4");
  assert(repo.RecordDecision(*tx, task.id, stale).code == ErrorCode::Conflict);
  stale.expected_quantity     = Decimal::Parse("5");
  stale.expected_task_type_id = NewId();
  assert(repo.RecordDecision(*tx, task.id, stale).code == ErrorCode::Conflict);
  assert(repo.GetWorkTask(*tx, task.id)->status == TaskStatus::kPending);

  auto fresh                  = Approve("50");
  fresh.expected_quantity     = Decimal::Parse("5.0");
  fresh.expected_task_type_id = seed.task_type_id;
  assert(repo.RecordDecision(*tx, task.id, fresh));
  assert(repo.GetWorkTask(*tx, task.id)->settled_pay == Decimal::Parse("50"));

  // a closed day freezes decisions
  assert(repo.SetWorkDayClosed(*tx, seed.day_id, true, std::string("sup-1"), NowMs()));
  auto reject   = Approve("0");
  reject.status = TaskStatus::kRejected;
  assert(repo.RecordDecision(*tx, task.id, reject).code == ErrorCode::Conflict);
  assert(repo.GetWorkTask(*tx, task.id)->status == TaskStatus::kApproved);

  assert(repo.RecordDecision(*tx, NewId(), fresh).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyEligibleWindow(Repository& repo) {
  auto seed = SeedWorkerDay(repo, "Cy Warp", "2024-04-01");

  auto tx = repo.Begin();

  WorkDayRecord outside{.id = NewId(), .worker_id = seed.worker_id, .work_date = ParseIsoDate("2024-04-09"), .logged_by = "sup-1"};
  assert(repo.InsertWorkDayIfAbsent(*tx, outside));

  auto inside_approved  = MakeTask(seed.day_id, seed.task_type_id, "1");
  auto inside_pending   = MakeTask(seed.day_id, seed.task_type_id, "2");
  auto outside_approved = MakeTask(outside.id, seed.task_type_id, "4");
  assert(repo.InsertWorkTaskIfAbsent(*tx, inside_approved));
  assert(repo.InsertWorkTaskIfAbsent(*tx, inside_pending));
  assert(repo.InsertWorkTaskIfAbsent(*tx, outside_approved));
  assert(repo.RecordDecision(*tx, inside_approved.id, Approve("10")));
  assert(repo.RecordDecision(*tx, outside_approved.id, Approve("40")));

  const auto rows = repo.ListEligibleTasks(*tx, seed.worker_id, ParseIsoDate("2024-04-01"), ParseIsoDate("2024-04-07"));
  assert(rows.size() == 1);
  assert(rows[0].task_id == inside_approved.id);
  assert(rows[0].quantity == Decimal::Parse("1"));
  assert(rows[0].settled_pay == Decimal::Parse("10"));
  assert(rows[0].category == RubricCategory::kPrimary);

  tx->Commit();
}

void VerifyRunReadWrite(Repository& repo) {
  auto first  = SeedWorkerDay(repo, "Mara Bobbin", "2024-05-01");
  auto second = SeedWorkerDay(repo, "Ezra Heddle", "2024-05-01");

  auto tx = repo.Begin();

  const auto now = NowMs();
  PayrollRunRecord older{.id = NewId(), .as_of = ParseIsoDate("2024-05-05"), .created_by = "admin-1", .note = std::nullopt, .created_at_ms = now};
  PayrollRunRecord newer{.id = NewId(), .as_of = ParseIsoDate("2024-05-12"), .created_by = "admin-1", .note = std::string("week 19"),
                         .created_at_ms = now + 1000};
  assert(repo.InsertPayrollRun(*tx, older));
  assert(repo.InsertPayrollRun(*tx, newer));

  const auto runs = repo.ListPayrollRuns(*tx, 2);
  assert(runs.size() == 2);
  assert(runs[0].id == newer.id);
  assert(runs[1].id == older.id);
  assert(runs[0].note == std::optional<std::string>("week 19"));

  PayrollRunItemRecord mara{.run_id             = newer.id,
                            .worker_id          = first.worker_id,
                            .worker_name        = "Mara Bobbin",
                            .payout             = PayoutFrequency::kWeekly,
                            .period_start       = ParseIsoDate("2024-04-29"),
                            .period_end         = ParseIsoDate("2024-05-05"),
                            .total_pay          = Decimal::Parse("12.50"),
                            .primary_quantity   = Decimal::Parse("1.25"),
                            .secondary_quantity = Decimal::Parse("0"),
                            .task_count         = 1};
  PayrollRunItemRecord ezra = mara;
  ezra.worker_id   = second.worker_id;
  ezra.worker_name = "Ezra Heddle";
  ezra.total_pay   = Decimal::Parse("7");

  assert(repo.InsertRunItemIfAbsent(*tx, mara));
  assert(repo.InsertRunItemIfAbsent(*tx, ezra));
  assert(repo.InsertRunItemIfAbsent(*tx, mara).code == ErrorCode::AlreadyExists);

  const auto items = repo.ListRunItems(*tx, newer.id);
  assert(items.size() == 2);
  assert(items[0].worker_name == "Ezra Heddle");
  assert(items[1].worker_name == "Mara Bobbin");
  assert(items[1].total_pay == Decimal::Parse("12.5"));
  assert(items[1].period_end == ParseIsoDate("2024-05-05"));

  auto fetched = repo.GetPayrollRun(*tx, older.id);
  assert(fetched.has_value());
  assert(fetched->as_of == ParseIsoDate("2024-05-05"));
  assert(!repo.GetPayrollRun(*tx, NewId()).has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  auto rolled  = MakeWorker("Rolled Back");
  auto dropped = MakeWorker("Dropped");
  {
    auto tx = repo.Begin();
    assert(repo.InsertWorker(*tx, rolled));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertWorker(*tx, dropped));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetWorker(*check_tx, rolled.id).has_value());
  assert(!repo.GetWorker(*check_tx, dropped.id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentClaims(Repository& repo) {
  auto seed = SeedWorkerDay(repo, "Nia Shuttle", "2024-06-03");

  std::vector<std::string> task_ids;
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 8; ++i) {
      auto task = MakeTask(seed.day_id, seed.task_type_id, "1");
      assert(repo.InsertWorkTaskIfAbsent(*tx, task));
      assert(repo.RecordDecision(*tx, task.id, Approve("10")));
      task_ids.push_back(task.id);
    }
    tx->Commit();
  }

  constexpr int            kRuns = 4;
  std::vector<int>         claimed(kRuns, 0);
  std::vector<std::thread> threads;
  for (int r = 0; r < kRuns; ++r) {
    threads.emplace_back([&, r]() {
      const auto run_id = "race-" + std::to_string(r);
      for (const auto& id : task_ids) {
        auto tx  = repo.Begin();
        auto res = repo.ClaimTaskForRun(*tx, id, run_id, NowMs());
        if (res) {
          tx->Commit();
          ++claimed[r];
        } else {
          assert(res.code == ErrorCode::Conflict);
          tx->Rollback();
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  int total = 0;
  for (int c : claimed) total += c;
  assert(total == static_cast<int>(task_ids.size()));

  auto tx = repo.Begin();
  assert(repo.ListEligibleTasks(*tx, seed.worker_id, ParseIsoDate("2024-06-03"), ParseIsoDate("2024-06-03")).empty());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  auto seed = SeedWorkerDay(*repo, "Durable Dana", "2024-07-01");
  auto task = MakeTask(seed.day_id, seed.task_type_id, "1.2345");
  {
    auto tx = repo->Begin();
    assert(repo->InsertWorkTaskIfAbsent(*tx, task));
    assert(repo->RecordDecision(*tx, task.id, Approve("12.35")));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto w  = repo->GetWorker(*tx, seed.worker_id);
  assert(w.has_value());
  assert(w->full_name == "Durable Dana");

  auto t = repo->GetWorkTask(*tx, task.id);
  assert(t.has_value());
  assert(t->quantity == Decimal::Parse("1.2345"));
  assert(t->settled_pay == Decimal::Parse("12.35"));
  assert(t->status == TaskStatus::kApproved);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if PIECEWORK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("piecework_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  // goes through the factory so the schema bootstrap is exercised as well
  auto make_repo = [db_path]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return piecework::factory::Build(config).repository;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if PIECEWORK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("PIECEWORK_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("PIECEWORK_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(8);
    return piecework::factory::Build(config).repository;
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyRosterReadWrite(*repo);
    VerifyWorkDayReadWrite(*repo);
    VerifyTaskGuards(*repo);
    VerifyDecisionGuards(*repo);
    VerifyEligibleWindow(*repo);
    VerifyRunReadWrite(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyConcurrentClaims(*repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if PIECEWORK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if PIECEWORK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "piecework_integration_repository_parity: pass\n";
  return 0;
}
