#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/audit/audit_recorder.hpp"
#include "internal/core/actor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/date.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::testing {

// Keeps every event so tests can assert on what was audited.
class CapturingAuditRecorder final : public audit::AuditRecorder {
 public:
  void Record(const piecework::v1::AuditEvent& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::size_t Count(const std::string& action) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(), [&](const auto& e) { return e.action() == action; }));
  }

  std::vector<piecework::v1::AuditEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex                     mutex_;
  std::vector<piecework::v1::AuditEvent> events_;
};

inline util::Date D(const char* iso) {
  return util::ParseIsoDate(iso);
}

inline util::Decimal Dec(const char* text) {
  return util::Decimal::Parse(text);
}

/*
  Application wired over an in-memory repository (or one supplied by the
  test), with an admin and a supervisor actor and shortcuts for seeding.
*/
struct Fixture {
  explicit Fixture(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>(),
                   const piecework::runtime::config::RuntimeConfig& config = {})
      : repository(std::move(repo)),
        audit(std::make_shared<CapturingAuditRecorder>()),
        app(factory::Build(config, repository, audit)) {
  }

  std::string AddWorker(const std::string& name, model::PayoutFrequency payout = model::PayoutFrequency::kWeekly,
                        const char* anchor = "2024-01-01", std::optional<std::string> factory_id = std::nullopt) {
    core::NewWorker worker;
    worker.full_name   = name;
    worker.payout      = payout;
    worker.anchor_date = D(anchor);
    worker.factory_id  = std::move(factory_id);
    return app.roster->CreateWorker(worker, admin);
  }

  std::string AddTaskType(const std::string& code, const char* rate,
                          model::RubricCategory category = model::RubricCategory::kNone) {
    core::NewTaskType task_type{code, code + " work", "kg", Dec(rate), category};
    return app.roster->UpsertTaskType(task_type, admin);
  }

  std::string OpenDay(const std::string& worker_id, const char* date) {
    return app.work_log->UpsertWorkDay(worker_id, D(date), std::nullopt, supervisor);
  }

  std::string AddTask(const std::string& day_id, const std::string& task_type_id, const char* quantity) {
    core::NewTask task;
    task.work_day_id  = day_id;
    task.task_type_id = task_type_id;
    task.quantity     = Dec(quantity);
    return app.work_log->AddTask(task, supervisor);
  }

  // Logs one task on `date` and approves it.
  std::string ApprovedTask(const std::string& worker_id, const char* date, const std::string& task_type_id,
                           const char* quantity) {
    const auto task_id = AddTask(OpenDay(worker_id, date), task_type_id, quantity);
    app.approvals->Decide(task_id, model::TaskStatus::kApproved, std::nullopt, supervisor);
    return task_id;
  }

  db::model::WorkTaskRecord Task(const std::string& task_id) {
    auto tx   = repository->Begin();
    auto task = repository->GetWorkTask(*tx, task_id);
    tx->Commit();
    if (!task) throw std::runtime_error("fixture: missing task " + task_id);
    return *task;
  }

  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<CapturingAuditRecorder> audit;
  factory::Application                    app;

  core::Actor admin      = core::AdminActor{"admin-1"};
  core::Actor supervisor = core::SupervisorActor{"sup-1", std::nullopt};
};

// Runs fn and reports whether it threw E.
template <class E, class Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace piecework::testing
