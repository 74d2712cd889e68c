#include "pg_repository.hpp"

#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/sql/patch_columns.hpp"

namespace piecework::db::postgres {

namespace {

constexpr const char* kWorkerCols =
    "id,worker_code,full_name,factory_id,payout,to_char(anchor_date,'YYYY-MM-DD'),active,created_at_ms";
constexpr const char* kTaskTypeCols = "id,code,name,unit,default_rate::text,category";
constexpr const char* kWorkDayCols =
    "id,worker_id,to_char(work_date,'YYYY-MM-DD'),logged_by,note,closed,closed_by,closed_at_ms,created_at_ms";
constexpr const char* kTaskCols =
    "t.id,t.work_day_id,t.task_type_id,t.quantity::text,t.note,t.status,t.decided_by,t.decided_at_ms,"
    "t.decision_reason,t.settled_pay::text,t.paid_run_id,t.paid_at_ms,t.created_at_ms,t.updated_by,t.updated_at_ms";
constexpr int         kTaskColCount = 15;
constexpr const char* kRunCols      = "id,to_char(as_of,'YYYY-MM-DD'),created_by,note,created_at_ms";
constexpr const char* kRunItemCols =
    "run_id,worker_id,worker_name,payout,to_char(period_start,'YYYY-MM-DD'),to_char(period_end,'YYYY-MM-DD'),"
    "total_pay::text,primary_quantity::text,secondary_quantity::text,task_count";

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

util::Decimal Dec(const pqxx::field& f) {
  return util::Decimal::Parse(f.c_str());
}

util::Date Day(const pqxx::field& f) {
  return util::ParseIsoDate(f.c_str());
}

std::string Iso(const util::Date& d) {
  return util::FormatIsoDate(d);
}

std::optional<std::string> Iso(const std::optional<util::Date>& d) {
  if (!d) return std::nullopt;
  return util::FormatIsoDate(*d);
}

model::WorkerRecord ReadWorker(const pqxx::row& row) {
  model::WorkerRecord r;
  r.id            = row[0].c_str();
  r.worker_code   = OptText(row[1]);
  r.full_name     = row[2].c_str();
  r.factory_id    = OptText(row[3]);
  r.payout        = static_cast<piecework::model::PayoutFrequency>(row[4].as<int>());
  r.anchor_date   = Day(row[5]);
  r.active        = row[6].as<bool>();
  r.created_at_ms = row[7].as<uint64_t>();
  return r;
}

model::TaskTypeRecord ReadTaskType(const pqxx::row& row) {
  model::TaskTypeRecord r;
  r.id           = row[0].c_str();
  r.code         = row[1].c_str();
  r.name         = row[2].c_str();
  r.unit         = row[3].c_str();
  r.default_rate = Dec(row[4]);
  r.category     = static_cast<piecework::model::RubricCategory>(row[5].as<int>());
  return r;
}

model::WorkDayRecord ReadWorkDay(const pqxx::row& row) {
  model::WorkDayRecord r;
  r.id            = row[0].c_str();
  r.worker_id     = row[1].c_str();
  r.work_date     = Day(row[2]);
  r.logged_by     = row[3].c_str();
  r.note          = OptText(row[4]);
  r.closed        = row[5].as<bool>();
  r.closed_by     = OptText(row[6]);
  r.closed_at_ms  = OptU64(row[7]);
  r.created_at_ms = row[8].as<uint64_t>();
  return r;
}

model::WorkTaskRecord ReadWorkTask(const pqxx::row& row) {
  model::WorkTaskRecord r;
  r.id              = row[0].c_str();
  r.work_day_id     = row[1].c_str();
  r.task_type_id    = row[2].c_str();
  r.quantity        = Dec(row[3]);
  r.note            = OptText(row[4]);
  r.status          = static_cast<piecework::model::TaskStatus>(row[5].as<int>());
  r.decided_by      = OptText(row[6]);
  r.decided_at_ms   = OptU64(row[7]);
  r.decision_reason = OptText(row[8]);
  r.settled_pay     = Dec(row[9]);
  r.paid_run_id     = OptText(row[10]);
  r.paid_at_ms      = OptU64(row[11]);
  r.created_at_ms   = row[12].as<uint64_t>();
  r.updated_by      = OptText(row[13]);
  r.updated_at_ms   = OptU64(row[14]);
  return r;
}

model::PayrollRunRecord ReadRun(const pqxx::row& row) {
  model::PayrollRunRecord r;
  r.id            = row[0].c_str();
  r.as_of         = Day(row[1]);
  r.created_by    = row[2].c_str();
  r.note          = OptText(row[3]);
  r.created_at_ms = row[4].as<uint64_t>();
  return r;
}

model::PayrollRunItemRecord ReadRunItem(const pqxx::row& row) {
  model::PayrollRunItemRecord r;
  r.run_id             = row[0].c_str();
  r.worker_id          = row[1].c_str();
  r.worker_name        = row[2].c_str();
  r.payout             = static_cast<piecework::model::PayoutFrequency>(row[3].as<int>());
  r.period_start       = Day(row[4]);
  r.period_end         = Day(row[5]);
  r.total_pay          = Dec(row[6]);
  r.primary_quantity   = Dec(row[7]);
  r.secondary_quantity = Dec(row[8]);
  r.task_count         = row[9].as<uint32_t>();
  return r;
}

void Append(pqxx::params& params, const sql::Param& p) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          params.append(std::optional<std::string>{});
        } else {
          params.append(v);
        }
      },
      p);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result PgRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO workers(id,worker_code,full_name,factory_id,payout,anchor_date,active,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::date,$7,$8) ON CONFLICT(id) DO NOTHING;",
        r.id, r.worker_code, r.full_name, r.factory_id, static_cast<int>(r.payout), Iso(r.anchor_date), r.active,
        r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "worker exists: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kWorkerCols + " FROM workers WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadWorker(res[0]);
}

std::vector<model::WorkerRecord> PgRepository::ListWorkers(Transaction& t, const WorkerFilter& filter) {
  std::string sql = std::string("SELECT ") + kWorkerCols + " FROM workers WHERE ($1 = false OR active)";
  sql += " AND ($2::text IS NULL OR factory_id=$2) ORDER BY full_name, id;";
  auto res = TX(t).Work().exec_params(sql, filter.active_only, filter.factory_id);

  std::vector<model::WorkerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadWorker(row));
  }
  return out;
}

Result PgRepository::PatchWorker(Transaction& t, const std::string& id, const WorkerPatch& p) {
  const auto assignments = sql::WorkerAssignments(p);
  if (assignments.empty()) {
    return GetWorker(t, id) ? Result::Ok() : Result::Err(ErrorCode::NotFound, "worker not found: " + id);
  }

  try {
    std::string  sql = "UPDATE workers SET ";
    pqxx::params params;
    // payout/active/anchor_date need casts from their bound representation
    for (std::size_t i = 0; i < assignments.size(); ++i) {
      const auto& column = assignments[i].first;
      if (i > 0) sql += ',';
      sql += column + "=$" + std::to_string(i + 1);
      if (column == "anchor_date") sql += "::date";
      if (column == "active") sql += "::int::boolean";
      Append(params, assignments[i].second);
    }
    sql += " WHERE id=$" + std::to_string(assignments.size() + 1) + ";";
    params.append(id);

    auto res = TX(t).Work().exec_params(sql, params);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "worker not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Task types and rates
// ------------------------------------------------------------------

Result PgRepository::UpsertTaskType(Transaction& t, const model::TaskTypeRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO task_types(id,code,name,unit,default_rate,category) VALUES($1,$2,$3,$4,$5::numeric,$6) "
        "ON CONFLICT(id) DO UPDATE SET code=EXCLUDED.code,name=EXCLUDED.name,unit=EXCLUDED.unit,"
        "default_rate=EXCLUDED.default_rate,category=EXCLUDED.category;",
        r.id, r.code, r.name, r.unit, r.default_rate.ToString(), static_cast<int>(r.category));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskTypeRecord> PgRepository::GetTaskType(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskTypeCols + " FROM task_types WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadTaskType(res[0]);
}

std::optional<model::TaskTypeRecord> PgRepository::GetTaskTypeByCode(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskTypeCols + " FROM task_types WHERE code=$1;", code);
  if (res.empty()) return std::nullopt;
  return ReadTaskType(res[0]);
}

std::vector<model::TaskTypeRecord> PgRepository::ListTaskTypes(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kTaskTypeCols + " FROM task_types ORDER BY code;");

  std::vector<model::TaskTypeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTaskType(row));
  }
  return out;
}

Result PgRepository::UpsertWorkerRate(Transaction& t, const model::WorkerRateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO worker_rates(worker_id,task_type_id,rate) VALUES($1,$2,$3::numeric) "
        "ON CONFLICT(worker_id,task_type_id) DO UPDATE SET rate=EXCLUDED.rate;",
        r.worker_id, r.task_type_id, r.rate.ToString());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRateRecord> PgRepository::GetWorkerRate(Transaction& t, const std::string& worker_id,
                                                                   const std::string& task_type_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT worker_id,task_type_id,rate::text FROM worker_rates WHERE worker_id=$1 AND task_type_id=$2;", worker_id,
      task_type_id);
  if (res.empty()) return std::nullopt;
  return model::WorkerRateRecord{res[0][0].c_str(), res[0][1].c_str(), Dec(res[0][2])};
}

std::vector<model::WorkerRateRecord> PgRepository::ListWorkerRates(Transaction& t, const std::string& worker_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT worker_id,task_type_id,rate::text FROM worker_rates WHERE worker_id=$1 ORDER BY task_type_id;", worker_id);

  std::vector<model::WorkerRateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(model::WorkerRateRecord{row[0].c_str(), row[1].c_str(), Dec(row[2])});
  }
  return out;
}

Result PgRepository::DeleteWorkerRate(Transaction& t, const std::string& worker_id, const std::string& task_type_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM worker_rates WHERE worker_id=$1 AND task_type_id=$2;", worker_id,
                                        task_type_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "no rate override for worker " + worker_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Work days
// ------------------------------------------------------------------

Result PgRepository::InsertWorkDayIfAbsent(Transaction& t, model::WorkDayRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params(
        "INSERT INTO work_days(id,worker_id,work_date,logged_by,note,closed,closed_by,closed_at_ms,created_at_ms) "
          "VALUES($1,$2,$3::date,$4,$5,$6,$7,$8,$9) ON CONFLICT(worker_id,work_date) DO NOTHING;",
        r.id, r.worker_id, Iso(r.work_date), r.logged_by, r.note, r.closed, r.closed_by, r.closed_at_ms, r.created_at_ms);
    if (res.affected_rows() == 1) return Result::Ok();

    auto existing = work.exec_params(
        std::string("SELECT ") + kWorkDayCols + " FROM work_days WHERE worker_id=$1 AND work_date=$2::date;", r.worker_id,
        Iso(r.work_date));
    if (existing.empty()) return Result::Err(ErrorCode::InternalError, "work day vanished after conflict");
    r = ReadWorkDay(existing[0]);
    return Result::Err(ErrorCode::AlreadyExists);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkDayRecord> PgRepository::GetWorkDay(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kWorkDayCols + " FROM work_days WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadWorkDay(res[0]);
}

std::vector<model::WorkDayRecord> PgRepository::ListWorkDays(Transaction& t, const std::string& worker_id,
                                                             std::optional<util::Date> start,
                                                             std::optional<util::Date> end) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kWorkDayCols +
                                          " FROM work_days WHERE worker_id=$1"
                                          " AND ($2::date IS NULL OR work_date>=$2::date)"
                                          " AND ($3::date IS NULL OR work_date<=$3::date)"
                                          " ORDER BY work_date DESC;",
                                      worker_id, Iso(start), Iso(end));

  std::vector<model::WorkDayRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadWorkDay(row));
  }
  return out;
}

Result PgRepository::UpdateWorkDayNote(Transaction& t, const std::string& id, const std::optional<std::string>& note) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE work_days SET note=$2 WHERE id=$1;", id, note);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetWorkDayClosed(Transaction& t, const std::string& id, bool closed,
                                      const std::optional<std::string>& closed_by, std::optional<uint64_t> closed_at_ms) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE work_days SET closed=$2,closed_by=$3,closed_at_ms=$4 WHERE id=$1;", id,
                                        closed, closed ? closed_by : std::nullopt,
                                        closed ? closed_at_ms : std::nullopt);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Work tasks
// ------------------------------------------------------------------

Result PgRepository::InsertWorkTaskIfAbsent(Transaction& t, const model::WorkTaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO work_tasks(id,work_day_id,task_type_id,quantity,note,status,decided_by,decided_at_ms,"
        "decision_reason,settled_pay,paid_run_id,paid_at_ms,created_at_ms,updated_by,updated_at_ms) "
        "VALUES($1,$2,$3,$4::numeric,$5,$6,$7,$8,$9,$10::numeric,$11,$12,$13,$14,$15) ON CONFLICT(id) DO NOTHING;",
        r.id, r.work_day_id, r.task_type_id, r.quantity.ToString(), r.note, static_cast<int>(r.status), r.decided_by,
        r.decided_at_ms, r.decision_reason, r.settled_pay.ToString(), r.paid_run_id, r.paid_at_ms, r.created_at_ms,
        r.updated_by, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkTaskRecord> PgRepository::GetWorkTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskCols + " FROM work_tasks t WHERE t.id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadWorkTask(res[0]);
}

std::vector<model::WorkTaskRecord> PgRepository::ListTasksForDay(Transaction& t, const std::string& work_day_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskCols + " FROM work_tasks t WHERE t.work_day_id=$1 ORDER BY t.created_at_ms, t.id;",
      work_day_id);

  std::vector<model::WorkTaskRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadWorkTask(row));
  }
  return out;
}

std::vector<PendingTaskRow> PgRepository::ListPendingTasks(Transaction& t, const PendingTaskFilter& filter) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskCols +
          ",to_char(d.work_date,'YYYY-MM-DD'),d.worker_id,w.full_name,tt.code,tt.unit FROM work_tasks t "
          "JOIN work_days d ON d.id=t.work_day_id "
          "JOIN workers w ON w.id=d.worker_id "
          "JOIN task_types tt ON tt.id=t.task_type_id "
          "WHERE t.status=0"
          " AND ($1::text IS NULL OR d.worker_id=$1)"
          " AND ($2::text IS NULL OR d.logged_by=$2)"
          " AND ($3::date IS NULL OR d.work_date>=$3::date)"
          " AND ($4::date IS NULL OR d.work_date<=$4::date)"
          " ORDER BY d.work_date DESC, t.created_at_ms, t.id;",
      filter.worker_id, filter.logged_by, Iso(filter.start), Iso(filter.end));

  std::vector<PendingTaskRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    PendingTaskRow r;
    r.task        = ReadWorkTask(row);
    r.work_date   = Day(row[kTaskColCount]);
    r.worker_id   = row[kTaskColCount + 1].c_str();
    r.worker_name = row[kTaskColCount + 2].c_str();
    r.task_code   = row[kTaskColCount + 3].c_str();
    r.unit        = row[kTaskColCount + 4].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::PatchWorkTask(Transaction& t, const std::string& id, const WorkTaskPatch& p,
                                   const std::string& updated_by, uint64_t updated_at_ms) {
  auto assignments = sql::WorkTaskAssignments(p);
  assignments.emplace_back("updated_by", updated_by);
  assignments.emplace_back("updated_at_ms", updated_at_ms);

  try {
    std::string  sql = "UPDATE work_tasks SET ";
    pqxx::params params;
    for (std::size_t i = 0; i < assignments.size(); ++i) {
      const auto& column = assignments[i].first;
      if (i > 0) sql += ',';
      sql += column + "=$" + std::to_string(i + 1);
      if (column == "quantity") sql += "::numeric";
      Append(params, assignments[i].second);
    }
    sql += " WHERE id=$" + std::to_string(assignments.size() + 1) + " AND status=0 AND paid_run_id IS NULL;";
    params.append(id);

    auto res = TX(t).Work().exec_params(sql, params);
    if (res.affected_rows() == 0) {
      if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
      return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteWorkTask(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM work_tasks WHERE id=$1 AND status=0 AND paid_run_id IS NULL;", id);
    if (res.affected_rows() == 0) {
      if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
      return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::RecordDecision(Transaction& t, const std::string& id, const TaskDecision& d) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE work_tasks SET status=$2,decided_by=$3,decided_at_ms=$4,decision_reason=$5,settled_pay=$6::numeric "
        "WHERE id=$1 AND paid_run_id IS NULL "
        "AND NOT EXISTS (SELECT 1 FROM work_days d WHERE d.id=work_tasks.work_day_id AND d.closed) "
        "AND ($7::numeric IS NULL OR quantity=$7::numeric) AND ($8::text IS NULL OR task_type_id=$8::text);",
        id, static_cast<int>(d.status), d.decided_by, d.decided_at_ms, d.reason, d.settled_pay.ToString(),
        d.expected_quantity ? std::optional<std::string>(d.expected_quantity->ToString()) : std::nullopt,
        d.expected_task_type_id);
    if (res.affected_rows() == 0) {
      if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
      return Result::Err(ErrorCode::Conflict, "task settled, its day closed, or changed since read: " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<EligibleTaskRow> PgRepository::ListEligibleTasks(Transaction& t, const std::string& worker_id, util::Date start,
                                                             util::Date end) {
  // row locks keep concurrent runs from summing the same tasks
  auto res = TX(t).Work().exec_params(
      "SELECT t.id,t.quantity::text,t.settled_pay::text,tt.category FROM work_tasks t "
      "JOIN work_days d ON d.id=t.work_day_id "
      "JOIN task_types tt ON tt.id=t.task_type_id "
      "WHERE d.worker_id=$1 AND t.status=1 AND t.paid_run_id IS NULL "
      "AND d.work_date>=$2::date AND d.work_date<=$3::date ORDER BY t.id FOR UPDATE OF t;",
      worker_id, Iso(start), Iso(end));

  std::vector<EligibleTaskRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    EligibleTaskRow r;
    r.task_id     = row[0].c_str();
    r.quantity    = Dec(row[1]);
    r.settled_pay = Dec(row[2]);
    r.category    = static_cast<piecework::model::RubricCategory>(row[3].as<int>());
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::ClaimTaskForRun(Transaction& t, const std::string& task_id, const std::string& run_id,
                                     uint64_t paid_at_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE work_tasks SET paid_run_id=$2,paid_at_ms=$3 WHERE id=$1 AND status=1 AND paid_run_id IS NULL;", task_id,
        run_id, paid_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "task not claimable: " + task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Payroll runs
// ------------------------------------------------------------------

Result PgRepository::InsertPayrollRun(Transaction& t, const model::PayrollRunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO payroll_runs(id,as_of,created_by,note,created_at_ms) VALUES($1,$2::date,$3,$4,$5) "
        "ON CONFLICT(id) DO NOTHING;",
        r.id, Iso(r.as_of), r.created_by, r.note, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "run exists: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PayrollRunRecord> PgRepository::GetPayrollRun(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunCols + " FROM payroll_runs WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<model::PayrollRunRecord> PgRepository::ListPayrollRuns(Transaction& t, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunCols + " FROM payroll_runs ORDER BY created_at_ms DESC, id DESC LIMIT $1;",
      static_cast<int64_t>(limit));

  std::vector<model::PayrollRunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRun(row));
  }
  return out;
}

Result PgRepository::InsertRunItemIfAbsent(Transaction& t, const model::PayrollRunItemRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO payroll_run_items(run_id,worker_id,worker_name,payout,period_start,period_end,total_pay,"
        "primary_quantity,secondary_quantity,task_count) "
        "VALUES($1,$2,$3,$4,$5::date,$6::date,$7::numeric,$8::numeric,$9::numeric,$10) "
        "ON CONFLICT(run_id,worker_id) DO NOTHING;",
        r.run_id, r.worker_id, r.worker_name, static_cast<int>(r.payout), Iso(r.period_start), Iso(r.period_end),
        r.total_pay.ToString(), r.primary_quantity.ToString(), r.secondary_quantity.ToString(),
        static_cast<int64_t>(r.task_count));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PayrollRunItemRecord> PgRepository::ListRunItems(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunItemCols + " FROM payroll_run_items WHERE run_id=$1 ORDER BY worker_name, worker_id;",
      run_id);

  std::vector<model::PayrollRunItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRunItem(row));
  }
  return out;
}

} // namespace piecework::db::postgres
