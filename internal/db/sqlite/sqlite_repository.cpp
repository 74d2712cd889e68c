#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/sql/patch_columns.hpp"

namespace piecework::db::sqlite {

using piecework::db::ErrorCode;
using piecework::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Null on failure; caller reports sqlite3_errmsg.
Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Stmt(st);
}

Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  auto st = Prepare(db, sql);
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

void CheckDone(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, std::optional<uint64_t> v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDecimal(sqlite3_stmt* st, int idx, const util::Decimal& d) {
  BindText(st, idx, d.ToString());
}

void BindDate(sqlite3_stmt* st, int idx, const util::Date& d) {
  BindText(st, idx, util::FormatIsoDate(d));
}

void BindParam(sqlite3_stmt* st, int idx, const sql::Param& p) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, std::string>) {
          BindText(st, idx, v);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          BindI32(st, idx, v);
        } else {
          sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        }
      },
      p);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

util::Decimal ColDecimal(sqlite3_stmt* st, int col) {
  return util::Decimal::Parse(ColText(st, col));
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  return util::ParseIsoDate(ColText(st, col));
}

constexpr const char* kWorkerCols   = "id,worker_code,full_name,factory_id,payout,anchor_date,active,created_at_ms";
constexpr const char* kTaskTypeCols = "id,code,name,unit,default_rate,category";
constexpr const char* kWorkDayCols =
    "id,worker_id,work_date,logged_by,note,closed,closed_by,closed_at_ms,created_at_ms";
constexpr const char* kTaskCols =
    "t.id,t.work_day_id,t.task_type_id,t.quantity,t.note,t.status,t.decided_by,t.decided_at_ms,"
    "t.decision_reason,t.settled_pay,t.paid_run_id,t.paid_at_ms,t.created_at_ms,t.updated_by,t.updated_at_ms";
constexpr int         kTaskColCount = 15;
constexpr const char* kRunCols      = "id,as_of,created_by,note,created_at_ms";
constexpr const char* kRunItemCols =
    "run_id,worker_id,worker_name,payout,period_start,period_end,total_pay,primary_quantity,"
    "secondary_quantity,task_count";

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
  model::WorkerRecord r;
  r.id            = ColText(st, 0);
  r.worker_code   = ColOptText(st, 1);
  r.full_name     = ColText(st, 2);
  r.factory_id    = ColOptText(st, 3);
  r.payout        = static_cast<piecework::model::PayoutFrequency>(ColI32(st, 4));
  r.anchor_date   = ColDate(st, 5);
  r.active        = ColI32(st, 6) != 0;
  r.created_at_ms = ColU64(st, 7);
  return r;
}

model::TaskTypeRecord ReadTaskType(sqlite3_stmt* st) {
  model::TaskTypeRecord r;
  r.id           = ColText(st, 0);
  r.code         = ColText(st, 1);
  r.name         = ColText(st, 2);
  r.unit         = ColText(st, 3);
  r.default_rate = ColDecimal(st, 4);
  r.category     = static_cast<piecework::model::RubricCategory>(ColI32(st, 5));
  return r;
}

model::WorkDayRecord ReadWorkDay(sqlite3_stmt* st) {
  model::WorkDayRecord r;
  r.id            = ColText(st, 0);
  r.worker_id     = ColText(st, 1);
  r.work_date     = ColDate(st, 2);
  r.logged_by     = ColText(st, 3);
  r.note          = ColOptText(st, 4);
  r.closed        = ColI32(st, 5) != 0;
  r.closed_by     = ColOptText(st, 6);
  r.closed_at_ms  = ColOptU64(st, 7);
  r.created_at_ms = ColU64(st, 8);
  return r;
}

model::WorkTaskRecord ReadWorkTask(sqlite3_stmt* st) {
  model::WorkTaskRecord r;
  r.id              = ColText(st, 0);
  r.work_day_id     = ColText(st, 1);
  r.task_type_id    = ColText(st, 2);
  r.quantity        = ColDecimal(st, 3);
  r.note            = ColOptText(st, 4);
  r.status          = static_cast<piecework::model::TaskStatus>(ColI32(st, 5));
  r.decided_by      = ColOptText(st, 6);
  r.decided_at_ms   = ColOptU64(st, 7);
  r.decision_reason = ColOptText(st, 8);
  r.settled_pay     = ColDecimal(st, 9);
  r.paid_run_id     = ColOptText(st, 10);
  r.paid_at_ms      = ColOptU64(st, 11);
  r.created_at_ms   = ColU64(st, 12);
  r.updated_by      = ColOptText(st, 13);
  r.updated_at_ms   = ColOptU64(st, 14);
  return r;
}

model::PayrollRunRecord ReadRun(sqlite3_stmt* st) {
  model::PayrollRunRecord r;
  r.id            = ColText(st, 0);
  r.as_of         = ColDate(st, 1);
  r.created_by    = ColText(st, 2);
  r.note          = ColOptText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  return r;
}

model::PayrollRunItemRecord ReadRunItem(sqlite3_stmt* st) {
  model::PayrollRunItemRecord r;
  r.run_id             = ColText(st, 0);
  r.worker_id          = ColText(st, 1);
  r.worker_name        = ColText(st, 2);
  r.payout             = static_cast<piecework::model::PayoutFrequency>(ColI32(st, 3));
  r.period_start       = ColDate(st, 4);
  r.period_end         = ColDate(st, 5);
  r.total_pay          = ColDecimal(st, 6);
  r.primary_quantity   = ColDecimal(st, 7);
  r.secondary_quantity = ColDecimal(st, 8);
  r.task_count         = static_cast<uint32_t>(ColI32(st, 9));
  return r;
}

std::string SetClause(const sql::Assignments& assignments) {
  std::string out;
  for (std::size_t i = 0; i < assignments.size(); ++i) {
    if (i > 0) out += ',';
    out += assignments[i].first + "=?";
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO workers(") + kWorkerCols + ") VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(id) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindOptText(st.get(), 2, r.worker_code);
  BindText(st.get(), 3, r.full_name);
  BindOptText(st.get(), 4, r.factory_id);
  BindI32(st.get(), 5, static_cast<int>(r.payout));
  BindDate(st.get(), 6, r.anchor_date);
  BindI32(st.get(), 7, r.active ? 1 : 0);
  BindU64(st.get(), 8, r.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "worker exists: " + r.id);
  return Result::Ok();
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kWorkerCols + " FROM workers WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadWorker(st.get());
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t, const WorkerFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kWorkerCols + " FROM workers WHERE 1=1";
  if (filter.active_only) sql += " AND active=1";
  if (filter.factory_id) sql += " AND factory_id=?";
  sql += " ORDER BY full_name, id;";

  auto st = PrepareOrThrow(db, sql);
  if (filter.factory_id) BindText(st.get(), 1, *filter.factory_id);

  std::vector<model::WorkerRecord> out;
  int                              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadWorker(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::PatchWorker(Transaction& t, const std::string& id, const WorkerPatch& p) {
  auto* db = TX(t).Handle();

  const auto assignments = sql::WorkerAssignments(p);
  if (assignments.empty()) {
    return GetWorker(t, id) ? Result::Ok() : Result::Err(ErrorCode::NotFound, "worker not found: " + id);
  }

  auto st = Prepare(db, "UPDATE workers SET " + SetClause(assignments) + " WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = 1;
  for (const auto& [_, param] : assignments) {
    BindParam(st.get(), idx++, param);
  }
  BindText(st.get(), idx, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "worker not found: " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Task types and rates
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTaskType(Transaction& t, const model::TaskTypeRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO task_types(") + kTaskTypeCols +
                            ") VALUES(?,?,?,?,?,?) "
                            "ON CONFLICT(id) DO UPDATE SET code=excluded.code, name=excluded.name, unit=excluded.unit, "
                            "default_rate=excluded.default_rate, category=excluded.category;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.code);
  BindText(st.get(), 3, r.name);
  BindText(st.get(), 4, r.unit);
  BindDecimal(st.get(), 5, r.default_rate);
  BindI32(st.get(), 6, static_cast<int>(r.category));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TaskTypeRecord> SqliteRepository::GetTaskType(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kTaskTypeCols + " FROM task_types WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadTaskType(st.get());
}

std::optional<model::TaskTypeRecord> SqliteRepository::GetTaskTypeByCode(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kTaskTypeCols + " FROM task_types WHERE code=?;");
  BindText(st.get(), 1, code);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadTaskType(st.get());
}

std::vector<model::TaskTypeRecord> SqliteRepository::ListTaskTypes(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kTaskTypeCols + " FROM task_types ORDER BY code;");

  std::vector<model::TaskTypeRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadTaskType(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::UpsertWorkerRate(Transaction& t, const model::WorkerRateRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO worker_rates(worker_id,task_type_id,rate) VALUES(?,?,?) "
                    "ON CONFLICT(worker_id,task_type_id) DO UPDATE SET rate=excluded.rate;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.worker_id);
  BindText(st.get(), 2, r.task_type_id);
  BindDecimal(st.get(), 3, r.rate);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::WorkerRateRecord> SqliteRepository::GetWorkerRate(Transaction& t, const std::string& worker_id,
                                                                       const std::string& task_type_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT worker_id,task_type_id,rate FROM worker_rates WHERE worker_id=? AND task_type_id=?;");
  BindText(st.get(), 1, worker_id);
  BindText(st.get(), 2, task_type_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return model::WorkerRateRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColDecimal(st.get(), 2)};
}

std::vector<model::WorkerRateRecord> SqliteRepository::ListWorkerRates(Transaction& t, const std::string& worker_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT worker_id,task_type_id,rate FROM worker_rates WHERE worker_id=? ORDER BY task_type_id;");
  BindText(st.get(), 1, worker_id);

  std::vector<model::WorkerRateRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(model::WorkerRateRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColDecimal(st.get(), 2)});
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::DeleteWorkerRate(Transaction& t, const std::string& worker_id, const std::string& task_type_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM worker_rates WHERE worker_id=? AND task_type_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, worker_id);
  BindText(st.get(), 2, task_type_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "no rate override for worker " + worker_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Work days
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorkDayIfAbsent(Transaction& t, model::WorkDayRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO work_days(") + kWorkDayCols +
                            ") VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT(worker_id,work_date) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.worker_id);
  BindDate(st.get(), 3, r.work_date);
  BindText(st.get(), 4, r.logged_by);
  BindOptText(st.get(), 5, r.note);
  BindI32(st.get(), 6, r.closed ? 1 : 0);
  BindOptText(st.get(), 7, r.closed_by);
  BindOptU64(st.get(), 8, r.closed_at_ms);
  BindU64(st.get(), 9, r.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  auto existing = PrepareOrThrow(db, std::string("SELECT ") + kWorkDayCols + " FROM work_days WHERE worker_id=? AND work_date=?;");
  BindText(existing.get(), 1, r.worker_id);
  BindDate(existing.get(), 2, r.work_date);
  if (sqlite3_step(existing.get()) != SQLITE_ROW) {
    return Result::Err(ErrorCode::InternalError, "work day vanished after conflict");
  }
  r = ReadWorkDay(existing.get());
  return Result::Err(ErrorCode::AlreadyExists);
}

std::optional<model::WorkDayRecord> SqliteRepository::GetWorkDay(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kWorkDayCols + " FROM work_days WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadWorkDay(st.get());
}

std::vector<model::WorkDayRecord> SqliteRepository::ListWorkDays(Transaction& t, const std::string& worker_id,
                                                                 std::optional<util::Date> start,
                                                                 std::optional<util::Date> end) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kWorkDayCols + " FROM work_days WHERE worker_id=?";
  if (start) sql += " AND work_date>=?";
  if (end) sql += " AND work_date<=?";
  sql += " ORDER BY work_date DESC;";

  auto st  = PrepareOrThrow(db, sql);
  int  idx = 1;
  BindText(st.get(), idx++, worker_id);
  if (start) BindDate(st.get(), idx++, *start);
  if (end) BindDate(st.get(), idx++, *end);

  std::vector<model::WorkDayRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadWorkDay(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::UpdateWorkDayNote(Transaction& t, const std::string& id, const std::optional<std::string>& note) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE work_days SET note=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindOptText(st.get(), 1, note);
  BindText(st.get(), 2, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
  return Result::Ok();
}

Result SqliteRepository::SetWorkDayClosed(Transaction& t, const std::string& id, bool closed,
                                          const std::optional<std::string>& closed_by,
                                          std::optional<uint64_t>           closed_at_ms) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE work_days SET closed=?,closed_by=?,closed_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI32(st.get(), 1, closed ? 1 : 0);
  BindOptText(st.get(), 2, closed ? closed_by : std::nullopt);
  BindOptU64(st.get(), 3, closed ? closed_at_ms : std::nullopt);
  BindText(st.get(), 4, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "work day not found: " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Work tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorkTaskIfAbsent(Transaction& t, const model::WorkTaskRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO work_tasks(id,work_day_id,task_type_id,quantity,note,status,decided_by,decided_at_ms,"
                    "decision_reason,settled_pay,paid_run_id,paid_at_ms,created_at_ms,updated_by,updated_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(id) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.work_day_id);
  BindText(st.get(), 3, r.task_type_id);
  BindDecimal(st.get(), 4, r.quantity);
  BindOptText(st.get(), 5, r.note);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindOptText(st.get(), 7, r.decided_by);
  BindOptU64(st.get(), 8, r.decided_at_ms);
  BindOptText(st.get(), 9, r.decision_reason);
  BindDecimal(st.get(), 10, r.settled_pay);
  BindOptText(st.get(), 11, r.paid_run_id);
  BindOptU64(st.get(), 12, r.paid_at_ms);
  BindU64(st.get(), 13, r.created_at_ms);
  BindOptText(st.get(), 14, r.updated_by);
  BindOptU64(st.get(), 15, r.updated_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::optional<model::WorkTaskRecord> SqliteRepository::GetWorkTask(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kTaskCols + " FROM work_tasks t WHERE t.id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadWorkTask(st.get());
}

std::vector<model::WorkTaskRecord> SqliteRepository::ListTasksForDay(Transaction& t, const std::string& work_day_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(
      db, std::string("SELECT ") + kTaskCols + " FROM work_tasks t WHERE t.work_day_id=? ORDER BY t.created_at_ms, t.id;");
  BindText(st.get(), 1, work_day_id);

  std::vector<model::WorkTaskRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadWorkTask(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

std::vector<PendingTaskRow> SqliteRepository::ListPendingTasks(Transaction& t, const PendingTaskFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kTaskCols +
                    ",d.work_date,d.worker_id,w.full_name,tt.code,tt.unit FROM work_tasks t "
                    "JOIN work_days d ON d.id=t.work_day_id "
                    "JOIN workers w ON w.id=d.worker_id "
                    "JOIN task_types tt ON tt.id=t.task_type_id "
                    "WHERE t.status=0";
  sql::Params params;
  if (filter.worker_id) {
    sql += " AND d.worker_id=?";
    params.emplace_back(*filter.worker_id);
  }
  if (filter.logged_by) {
    sql += " AND d.logged_by=?";
    params.emplace_back(*filter.logged_by);
  }
  if (filter.start) {
    sql += " AND d.work_date>=?";
    params.emplace_back(util::FormatIsoDate(*filter.start));
  }
  if (filter.end) {
    sql += " AND d.work_date<=?";
    params.emplace_back(util::FormatIsoDate(*filter.end));
  }
  sql += " ORDER BY d.work_date DESC, t.created_at_ms, t.id;";

  auto st = PrepareOrThrow(db, sql);
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindParam(st.get(), static_cast<int>(i) + 1, params[i]);
  }

  std::vector<PendingTaskRow> out;
  int                         rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    PendingTaskRow row;
    row.task        = ReadWorkTask(st.get());
    row.work_date   = ColDate(st.get(), kTaskColCount);
    row.worker_id   = ColText(st.get(), kTaskColCount + 1);
    row.worker_name = ColText(st.get(), kTaskColCount + 2);
    row.task_code   = ColText(st.get(), kTaskColCount + 3);
    row.unit        = ColText(st.get(), kTaskColCount + 4);
    out.push_back(std::move(row));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::PatchWorkTask(Transaction& t, const std::string& id, const WorkTaskPatch& p,
                                       const std::string& updated_by, uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  auto assignments = sql::WorkTaskAssignments(p);
  assignments.emplace_back("updated_by", updated_by);
  assignments.emplace_back("updated_at_ms", updated_at_ms);

  auto st = Prepare(db, "UPDATE work_tasks SET " + SetClause(assignments) + " WHERE id=? AND status=0 AND paid_run_id IS NULL;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = 1;
  for (const auto& [_, param] : assignments) {
    BindParam(st.get(), idx++, param);
  }
  BindText(st.get(), idx, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
    return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteWorkTask(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM work_tasks WHERE id=? AND status=0 AND paid_run_id IS NULL;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
    return Result::Err(ErrorCode::Conflict, "task is no longer pending: " + id);
  }
  return Result::Ok();
}

Result SqliteRepository::RecordDecision(Transaction& t, const std::string& id, const TaskDecision& d) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE work_tasks SET status=?1,decided_by=?2,decided_at_ms=?3,decision_reason=?4,settled_pay=?5 "
                    "WHERE id=?6 AND paid_run_id IS NULL "
                    "AND NOT EXISTS (SELECT 1 FROM work_days d WHERE d.id=work_tasks.work_day_id AND d.closed=1) "
                    "AND (?7 IS NULL OR quantity=?7) AND (?8 IS NULL OR task_type_id=?8);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(d.status));
  BindText(st.get(), 2, d.decided_by);
  BindU64(st.get(), 3, d.decided_at_ms);
  BindOptText(st.get(), 4, d.reason);
  BindDecimal(st.get(), 5, d.settled_pay);
  BindText(st.get(), 6, id);
  BindOptText(st.get(), 7, d.expected_quantity ? std::optional<std::string>(d.expected_quantity->ToString()) : std::nullopt);
  BindOptText(st.get(), 8, d.expected_task_type_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetWorkTask(t, id)) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
    return Result::Err(ErrorCode::Conflict, "task settled, its day closed, or changed since read: " + id);
  }
  return Result::Ok();
}

std::vector<EligibleTaskRow> SqliteRepository::ListEligibleTasks(Transaction& t, const std::string& worker_id, util::Date start,
                                                                 util::Date end) {
  auto* db = TX(t).Handle();

  // BEGIN IMMEDIATE already holds the write lock; no row locking needed.
  auto st = PrepareOrThrow(db,
                           "SELECT t.id,t.quantity,t.settled_pay,tt.category FROM work_tasks t "
                           "JOIN work_days d ON d.id=t.work_day_id "
                           "JOIN task_types tt ON tt.id=t.task_type_id "
                           "WHERE d.worker_id=? AND t.status=1 AND t.paid_run_id IS NULL "
                           "AND d.work_date>=? AND d.work_date<=? ORDER BY t.id;");
  BindText(st.get(), 1, worker_id);
  BindDate(st.get(), 2, start);
  BindDate(st.get(), 3, end);

  std::vector<EligibleTaskRow> out;
  int                          rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    EligibleTaskRow row;
    row.task_id     = ColText(st.get(), 0);
    row.quantity    = ColDecimal(st.get(), 1);
    row.settled_pay = ColDecimal(st.get(), 2);
    row.category    = static_cast<piecework::model::RubricCategory>(ColI32(st.get(), 3));
    out.push_back(std::move(row));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::ClaimTaskForRun(Transaction& t, const std::string& task_id, const std::string& run_id,
                                         uint64_t paid_at_ms) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE work_tasks SET paid_run_id=?,paid_at_ms=? WHERE id=? AND status=1 AND paid_run_id IS NULL;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, run_id);
  BindU64(st.get(), 2, paid_at_ms);
  BindText(st.get(), 3, task_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "task not claimable: " + task_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payroll runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayrollRun(Transaction& t, const model::PayrollRunRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO payroll_runs(") + kRunCols + ") VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindDate(st.get(), 2, r.as_of);
  BindText(st.get(), 3, r.created_by);
  BindOptText(st.get(), 4, r.note);
  BindU64(st.get(), 5, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PayrollRunRecord> SqliteRepository::GetPayrollRun(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRunCols + " FROM payroll_runs WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return std::nullopt;
  }
  return ReadRun(st.get());
}

std::vector<model::PayrollRunRecord> SqliteRepository::ListPayrollRuns(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRunCols + " FROM payroll_runs ORDER BY created_at_ms DESC, id DESC LIMIT ?;");
  BindU64(st.get(), 1, limit);

  std::vector<model::PayrollRunRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRun(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

Result SqliteRepository::InsertRunItemIfAbsent(Transaction& t, const model::PayrollRunItemRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO payroll_run_items(") + kRunItemCols +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?) ON CONFLICT(run_id,worker_id) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.worker_id);
  BindText(st.get(), 3, r.worker_name);
  BindI32(st.get(), 4, static_cast<int>(r.payout));
  BindDate(st.get(), 5, r.period_start);
  BindDate(st.get(), 6, r.period_end);
  BindDecimal(st.get(), 7, r.total_pay);
  BindDecimal(st.get(), 8, r.primary_quantity);
  BindDecimal(st.get(), 9, r.secondary_quantity);
  BindI32(st.get(), 10, static_cast<int>(r.task_count));

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::vector<model::PayrollRunItemRecord> SqliteRepository::ListRunItems(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRunItemCols +
                                    " FROM payroll_run_items WHERE run_id=? ORDER BY worker_name, worker_id;");
  BindText(st.get(), 1, run_id);

  std::vector<model::PayrollRunItemRecord> out;
  int                                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRunItem(st.get()));
  }
  CheckDone(db, rc);
  return out;
}

} // namespace piecework::db::sqlite
