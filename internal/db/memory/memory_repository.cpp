#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace piecework::db::memory {

namespace {

std::string PairKey(const std::string& a, const std::string& b) {
  return a + "#" + b;
}

bool InWindow(const util::Date& date, const std::optional<util::Date>& start, const std::optional<util::Date>& end) {
  if (start && date < *start) return false;
  if (end && date > *end) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// -----------------------------------------------------------------------------
// Workers
// -----------------------------------------------------------------------------

Result MemoryRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.workers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "worker exists: " + r.id);
  if (r.worker_code) {
    for (const auto& [_, w] : s.workers) {
      if (w.worker_code == r.worker_code) {
        return Result::Err(ErrorCode::ConstraintViolation, "worker_code already in use: " + *r.worker_code);
      }
    }
  }
  s.workers[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t, const WorkerFilter& filter) {
  std::vector<model::WorkerRecord> out;
  for (const auto& [_, w] : TX(t).View().workers) {
    if (filter.active_only && !w.active) continue;
    if (filter.factory_id && w.factory_id != filter.factory_id) continue;
    out.push_back(w);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.full_name, a.id) < std::tie(b.full_name, b.id); });
  return out;
}

Result MemoryRepository::PatchWorker(Transaction& t, const std::string& id, const WorkerPatch& p) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workers.find(id);
  if (it == s.workers.end()) return Result::Err(ErrorCode::NotFound, "worker not found: " + id);

  if (p.worker_code && *p.worker_code) {
    for (const auto& [other_id, w] : s.workers) {
      if (other_id != id && w.worker_code == *p.worker_code) {
        return Result::Err(ErrorCode::ConstraintViolation, "worker_code already in use: " + **p.worker_code);
      }
    }
  }

  auto& w = it->second;
  if (p.worker_code) w.worker_code = *p.worker_code;
  if (p.full_name) w.full_name = *p.full_name;
  if (p.factory_id) w.factory_id = *p.factory_id;
  if (p.payout) w.payout = *p.payout;
  if (p.anchor_date) w.anchor_date = *p.anchor_date;
  if (p.active) w.active = *p.active;
  return Result::Ok();
}

// -----------------------------------------------------------------------------
// Task types and rates
// -----------------------------------------------------------------------------

Result MemoryRepository::UpsertTaskType(Transaction& t, const model::TaskTypeRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [other_id, tt] : s.task_types) {
    if (other_id != r.id && tt.code == r.code) {
      return Result::Err(ErrorCode::ConstraintViolation, "task type code already in use: " + r.code);
    }
  }
  s.task_types[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskTypeRecord> MemoryRepository::GetTaskType(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.task_types.find(id);
  if (it == s.task_types.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TaskTypeRecord> MemoryRepository::GetTaskTypeByCode(Transaction& t, const std::string& code) {
  for (const auto& [_, tt] : TX(t).View().task_types) {
    if (tt.code == code) return tt;
  }
  return std::nullopt;
}

std::vector<model::TaskTypeRecord> MemoryRepository::ListTaskTypes(Transaction& t) {
  std::vector<model::TaskTypeRecord> out;
  for (const auto& [_, tt] : TX(t).View().task_types) {
    out.push_back(tt);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.code < b.code; });
  return out;
}

Result MemoryRepository::UpsertWorkerRate(Transaction& t, const model::WorkerRateRecord& r) {
  TX(t).Mutable().worker_rates[PairKey(r.worker_id, r.task_type_id)] = r;
  return Result::Ok();
}

std::optional<model::WorkerRateRecord> MemoryRepository::GetWorkerRate(Transaction& t, const std::string& worker_id,
                                                                       const std::string& task_type_id) {
  const auto& s  = TX(t).View();
  auto        it = s.worker_rates.find(PairKey(worker_id, task_type_id));
  if (it == s.worker_rates.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRateRecord> MemoryRepository::ListWorkerRates(Transaction& t, const std::string& worker_id) {
  std::vector<model::WorkerRateRecord> out;
  for (const auto& [_, r] : TX(t).View().worker_rates) {
    if (r.worker_id == worker_id) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::DeleteWorkerRate(Transaction& t, const std::string& worker_id, const std::string& task_type_id) {
  if (TX(t).Mutable().worker_rates.erase(PairKey(worker_id, task_type_id)) == 0) {
    return Result::Err(ErrorCode::NotFound, "no rate override for worker " + worker_id);
  }
  return Result::Ok();
}

// -----------------------------------------------------------------------------
// Work days
// -----------------------------------------------------------------------------

Result MemoryRepository::InsertWorkDayIfAbsent(Transaction& t, model::WorkDayRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = PairKey(r.worker_id, util::FormatIsoDate(r.work_date));
  if (auto it = s.work_day_keys.find(key); it != s.work_day_keys.end()) {
    r = s.work_days.at(it->second);
    return Result::Err(ErrorCode::AlreadyExists);
  }
  if (s.work_days.contains(r.id)) return Result::Err(ErrorCode::ConstraintViolation, "work day id reused: " + r.id);
  s.work_days[r.id]  = r;
  s.work_day_keys[key] = r.id;
  return Result::Ok();
}

std::optional<model::WorkDayRecord> MemoryRepository::GetWorkDay(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.work_days.find(id);
  if (it == s.work_days.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkDayRecord> MemoryRepository::ListWorkDays(Transaction& t, const std::string& worker_id,
                                                                 std::optional<util::Date> start,
                                                                 std::optional<util::Date> end) {
  std::vector<model::WorkDayRecord> out;
  for (const auto& [_, d] : TX(t).View().work_days) {
    if (d.worker_id == worker_id && InWindow(d.work_date, start, end)) out.push_back(d);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.work_date > b.work_date; });
  return out;
}

Result MemoryRepository::UpdateWorkDayNote(Transaction& t, const std::string& id, const std::optional<std::string>& note) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_days.find(id);
  if (it == s.work_days.end()) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
  it->second.note = note;
  return Result::Ok();
}

Result MemoryRepository::SetWorkDayClosed(Transaction& t, const std::string& id, bool closed,
                                          const std::optional<std::string>& closed_by,
                                          std::optional<uint64_t>           closed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_days.find(id);
  if (it == s.work_days.end()) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
  auto& d        = it->second;
  d.closed       = closed;
  d.closed_by    = closed ? closed_by : std::nullopt;
  d.closed_at_ms = closed ? closed_at_ms : std::nullopt;
  return Result::Ok();
}

// -----------------------------------------------------------------------------
// Work tasks
// -----------------------------------------------------------------------------

Result MemoryRepository::InsertWorkTaskIfAbsent(Transaction& t, const model::WorkTaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.work_tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (!s.work_days.contains(r.work_day_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown work day: " + r.work_day_id);
  if (!s.task_types.contains(r.task_type_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown task type: " + r.task_type_id);
  s.work_tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkTaskRecord> MemoryRepository::GetWorkTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.work_tasks.find(id);
  if (it == s.work_tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkTaskRecord> MemoryRepository::ListTasksForDay(Transaction& t, const std::string& work_day_id) {
  std::vector<model::WorkTaskRecord> out;
  for (const auto& [_, task] : TX(t).View().work_tasks) {
    if (task.work_day_id == work_day_id) out.push_back(task);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id); });
  return out;
}

std::vector<PendingTaskRow> MemoryRepository::ListPendingTasks(Transaction& t, const PendingTaskFilter& filter) {
  const auto&                 s = TX(t).View();
  std::vector<PendingTaskRow> out;
  for (const auto& [_, task] : s.work_tasks) {
    if (task.status != piecework::model::TaskStatus::kPending) continue;

    const auto& day = s.work_days.at(task.work_day_id);
    if (filter.worker_id && day.worker_id != *filter.worker_id) continue;
    if (filter.logged_by && day.logged_by != *filter.logged_by) continue;
    if (!InWindow(day.work_date, filter.start, filter.end)) continue;

    PendingTaskRow row;
    row.task      = task;
    row.work_date = day.work_date;
    row.worker_id = day.worker_id;
    if (auto w = s.workers.find(day.worker_id); w != s.workers.end()) row.worker_name = w->second.full_name;
    if (auto tt = s.task_types.find(task.task_type_id); tt != s.task_types.end()) {
      row.task_code = tt->second.code;
      row.unit      = tt->second.unit;
    }
    out.push_back(std::move(row));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.work_date != b.work_date) return a.work_date > b.work_date;
    return std::tie(a.task.created_at_ms, a.task.id) < std::tie(b.task.created_at_ms, b.task.id);
  });
  return out;
}

Result MemoryRepository::PatchWorkTask(Transaction& t, const std::string& id, const WorkTaskPatch& p,
                                       const std::string& updated_by, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_tasks.find(id);
  if (it == s.work_tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  auto& task = it->second;
  if (task.status != piecework::model::TaskStatus::kPending || task.IsPaid()) {
    return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
  }
  if (p.task_type_id && !s.task_types.contains(*p.task_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown task type: " + *p.task_type_id);
  }
  if (p.quantity) task.quantity = *p.quantity;
  if (p.task_type_id) task.task_type_id = *p.task_type_id;
  if (p.note) task.note = *p.note;
  task.updated_by    = updated_by;
  task.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteWorkTask(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_tasks.find(id);
  if (it == s.work_tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  if (it->second.status != piecework::model::TaskStatus::kPending || it->second.IsPaid()) {
    return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
  }
  s.work_tasks.erase(it);
  return Result::Ok();
}

Result MemoryRepository::RecordDecision(Transaction& t, const std::string& id, const TaskDecision& d) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_tasks.find(id);
  if (it == s.work_tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  auto& task = it->second;
  if (task.IsPaid()) return Result::Err(ErrorCode::Conflict, "task already settled: " + id);
  if (auto day = s.work_days.find(task.work_day_id); day != s.work_days.end() && day->second.closed) {
    return Result::Err(ErrorCode::Conflict, "work day is closed: " + task.work_day_id);
  }
  if ((d.expected_quantity && task.quantity != *d.expected_quantity) ||
      (d.expected_task_type_id && task.task_type_id != *d.expected_task_type_id)) {
    return Result::Err(ErrorCode::Conflict, "task changed since it was read: " + id);
  }
  task.status          = d.status;
  task.decided_by      = d.decided_by;
  task.decided_at_ms   = d.decided_at_ms;
  task.decision_reason = d.reason;
  task.settled_pay     = d.settled_pay;
  return Result::Ok();
}

std::vector<EligibleTaskRow> MemoryRepository::ListEligibleTasks(Transaction& t, const std::string& worker_id, util::Date start,
                                                                 util::Date end) {
  const auto&                  s = TX(t).View();
  std::vector<EligibleTaskRow> out;
  for (const auto& [_, task] : s.work_tasks) {
    if (task.status != piecework::model::TaskStatus::kApproved || task.IsPaid()) continue;
    const auto& day = s.work_days.at(task.work_day_id);
    if (day.worker_id != worker_id || day.work_date < start || day.work_date > end) continue;

    EligibleTaskRow row;
    row.task_id     = task.id;
    row.quantity    = task.quantity;
    row.settled_pay = task.settled_pay;
    if (auto tt = s.task_types.find(task.task_type_id); tt != s.task_types.end()) row.category = tt->second.category;
    out.push_back(std::move(row));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.task_id < b.task_id; });
  return out;
}

Result MemoryRepository::ClaimTaskForRun(Transaction& t, const std::string& task_id, const std::string& run_id,
                                         uint64_t paid_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.work_tasks.find(task_id);
  if (it == s.work_tasks.end() || it->second.IsPaid() || it->second.status != piecework::model::TaskStatus::kApproved) {
    return Result::Err(ErrorCode::Conflict, "task not claimable: " + task_id);
  }
  it->second.paid_run_id = run_id;
  it->second.paid_at_ms  = paid_at_ms;
  return Result::Ok();
}

// -----------------------------------------------------------------------------
// Payroll runs
// -----------------------------------------------------------------------------

Result MemoryRepository::InsertPayrollRun(Transaction& t, const model::PayrollRunRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "run exists: " + r.id);
  s.runs[r.id] = r;
  return Result::Ok();
}

std::optional<model::PayrollRunRecord> MemoryRepository::GetPayrollRun(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PayrollRunRecord> MemoryRepository::ListPayrollRuns(Transaction& t, std::size_t limit) {
  std::vector<model::PayrollRunRecord> out;
  for (const auto& [_, r] : TX(t).View().runs) {
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.created_at_ms, a.id) > std::tie(b.created_at_ms, b.id); });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::InsertRunItemIfAbsent(Transaction& t, const model::PayrollRunItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown run: " + r.run_id);
  if (!s.run_items.try_emplace(PairKey(r.run_id, r.worker_id), r).second) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  return Result::Ok();
}

std::vector<model::PayrollRunItemRecord> MemoryRepository::ListRunItems(Transaction& t, const std::string& run_id) {
  std::vector<model::PayrollRunItemRecord> out;
  for (const auto& [_, item] : TX(t).View().run_items) {
    if (item.run_id == run_id) out.push_back(item);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.worker_name, a.worker_id) < std::tie(b.worker_name, b.worker_id); });
  return out;
}

} // namespace piecework::db::memory
