#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/rate_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if PIECEWORK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PIECEWORK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace piecework::factory {

namespace {

constexpr int      kDefaultCurrencyPlaces = 2;
constexpr uint32_t kDefaultBusyTimeoutMs  = 5000;
constexpr uint32_t kDefaultMaxConnections = 16;

#if PIECEWORK_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, worker_code TEXT UNIQUE, full_name TEXT NOT NULL, factory_id TEXT, payout INTEGER NOT NULL, anchor_date TEXT NOT NULL, active INTEGER NOT NULL DEFAULT 1, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS task_types (id TEXT PRIMARY KEY, code TEXT NOT NULL UNIQUE, name TEXT NOT NULL, unit TEXT NOT NULL, default_rate TEXT NOT NULL, category INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS worker_rates (worker_id TEXT NOT NULL REFERENCES workers(id), task_type_id TEXT NOT NULL REFERENCES task_types(id), rate TEXT NOT NULL, PRIMARY KEY (worker_id, task_type_id));",
      "CREATE TABLE IF NOT EXISTS work_days (id TEXT PRIMARY KEY, worker_id TEXT NOT NULL REFERENCES workers(id), work_date TEXT NOT NULL, logged_by TEXT NOT NULL, note TEXT, closed INTEGER NOT NULL DEFAULT 0, closed_by TEXT, closed_at_ms INTEGER, created_at_ms INTEGER NOT NULL, UNIQUE(worker_id, work_date));",
      "CREATE TABLE IF NOT EXISTS work_tasks (id TEXT PRIMARY KEY, work_day_id TEXT NOT NULL REFERENCES work_days(id), task_type_id TEXT NOT NULL REFERENCES task_types(id), quantity TEXT NOT NULL, note TEXT, status INTEGER NOT NULL DEFAULT 0, decided_by TEXT, decided_at_ms INTEGER, decision_reason TEXT, settled_pay TEXT NOT NULL DEFAULT '0', paid_run_id TEXT, paid_at_ms INTEGER, created_at_ms INTEGER NOT NULL, updated_by TEXT, updated_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS work_tasks_day_idx ON work_tasks(work_day_id);",
      "CREATE TABLE IF NOT EXISTS payroll_runs (id TEXT PRIMARY KEY, as_of TEXT NOT NULL, created_by TEXT NOT NULL, note TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payroll_run_items (run_id TEXT NOT NULL REFERENCES payroll_runs(id), worker_id TEXT NOT NULL REFERENCES workers(id), worker_name TEXT NOT NULL, payout INTEGER NOT NULL, period_start TEXT NOT NULL, period_end TEXT NOT NULL, total_pay TEXT NOT NULL, primary_quantity TEXT NOT NULL, secondary_quantity TEXT NOT NULL, task_count INTEGER NOT NULL, PRIMARY KEY (run_id, worker_id));"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if PIECEWORK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, worker_code TEXT UNIQUE, full_name TEXT NOT NULL, factory_id TEXT, payout SMALLINT NOT NULL, anchor_date DATE NOT NULL, active BOOLEAN NOT NULL DEFAULT TRUE, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS task_types (id TEXT PRIMARY KEY, code TEXT NOT NULL UNIQUE, name TEXT NOT NULL, unit TEXT NOT NULL, default_rate NUMERIC(18,4) NOT NULL, category SMALLINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE TABLE IF NOT EXISTS worker_rates (worker_id TEXT NOT NULL REFERENCES workers(id), task_type_id TEXT NOT NULL REFERENCES task_types(id), rate NUMERIC(18,4) NOT NULL, PRIMARY KEY (worker_id, task_type_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS work_days (id TEXT PRIMARY KEY, worker_id TEXT NOT NULL REFERENCES workers(id), work_date DATE NOT NULL, logged_by TEXT NOT NULL, note TEXT, closed BOOLEAN NOT NULL DEFAULT FALSE, closed_by TEXT, closed_at_ms BIGINT, created_at_ms BIGINT NOT NULL, UNIQUE(worker_id, work_date));");
  tx.exec("CREATE TABLE IF NOT EXISTS work_tasks (id TEXT PRIMARY KEY, work_day_id TEXT NOT NULL REFERENCES work_days(id), task_type_id TEXT NOT NULL REFERENCES task_types(id), quantity NUMERIC(18,4) NOT NULL, note TEXT, status SMALLINT NOT NULL DEFAULT 0, decided_by TEXT, decided_at_ms BIGINT, decision_reason TEXT, settled_pay NUMERIC(18,4) NOT NULL DEFAULT 0, paid_run_id TEXT, paid_at_ms BIGINT, created_at_ms BIGINT NOT NULL, updated_by TEXT, updated_at_ms BIGINT);");
  tx.exec("CREATE INDEX IF NOT EXISTS work_tasks_day_idx ON work_tasks(work_day_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS payroll_runs (id TEXT PRIMARY KEY, as_of DATE NOT NULL, created_by TEXT NOT NULL, note TEXT, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS payroll_run_items (run_id TEXT NOT NULL REFERENCES payroll_runs(id), worker_id TEXT NOT NULL REFERENCES workers(id), worker_name TEXT NOT NULL, payout SMALLINT NOT NULL, period_start DATE NOT NULL, period_end DATE NOT NULL, total_pay NUMERIC(18,4) NOT NULL, primary_quantity NUMERIC(18,4) NOT NULL, secondary_quantity NUMERIC(18,4) NOT NULL, task_count INTEGER NOT NULL, PRIMARY KEY (run_id, worker_id));");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const piecework::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PIECEWORK_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::Validation("database.sqlite.path is required");
    }
    const auto busy_timeout =
        database.sqlite().busy_timeout_ms() ? database.sqlite().busy_timeout_ms() : kDefaultBusyTimeoutMs;
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), static_cast<int>(busy_timeout));
    BootstrapSqliteSchema(sqlite_db);
    PIECEWORK_LOG_INFO("using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PIECEWORK_DB_POSTGRES
    if (database.postgres().connection_uri().empty()) {
      throw util::Validation("database.postgres.connection_uri is required");
    }
    const auto max_connections =
        database.postgres().max_connections() ? database.postgres().max_connections() : kDefaultMaxConnections;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    PIECEWORK_LOG_INFO("using postgres backend", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PIECEWORK_LOG_INFO("using in-memory backend");
  return std::make_shared<db::memory::MemoryRepository>();
}

int CurrencyPlaces(const piecework::runtime::config::RuntimeConfig& config) {
  if (!config.settlement().has_currency_places()) {
    return kDefaultCurrencyPlaces;
  }
  const auto places = config.settlement().currency_places();
  if (places > static_cast<uint32_t>(util::Decimal::kScale)) {
    throw util::Validation("settlement.currency_places must be between 0 and " + std::to_string(util::Decimal::kScale));
  }
  return static_cast<int>(places);
}

} // namespace

Application Build(const piecework::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                  std::shared_ptr<audit::AuditRecorder> audit) {
  Application app;
  app.currency_places = CurrencyPlaces(config);
  app.repository      = std::move(repository);
  app.audit           = std::move(audit);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto rates = std::make_shared<core::RateResolver>(app.repository);

  app.rubric     = std::make_shared<core::RubricEvaluator>(core::RubricSettings::FromConfig(config));
  app.roster     = std::make_shared<core::RosterManager>(app.repository, app.audit);
  app.work_log   = std::make_shared<core::WorkLog>(app.repository, app.rubric, app.audit);
  app.approvals  = std::make_shared<core::ApprovalManager>(app.repository, rates, app.audit, app.currency_places);
  app.settlement = std::make_shared<core::SettlementEngine>(app.repository, app.audit, app.currency_places);

  return app;
}

/*
    Build full application dependency graph
*/
Application Build(const piecework::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config), std::make_shared<audit::LogAuditRecorder>());
}

} // namespace piecework::factory
