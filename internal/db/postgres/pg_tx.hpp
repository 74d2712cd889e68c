#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace piecework::db::postgres {

/*
  READ COMMITTED pqxx::work on a pooled connection.

  Conditional UPDATEs re-check their WHERE clause against the latest row
  version, and settlement reads take FOR UPDATE locks, which together keep
  the claim exactly-once without SERIALIZABLE.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace piecework::db::postgres
