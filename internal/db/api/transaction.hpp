#pragma once

namespace piecework::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Rows read for settlement stay stable until Commit()/Rollback()

  SQLite: BEGIN IMMEDIATE (single writer)
  Postgres: pqxx::work + SELECT ... FOR UPDATE on claimed rows
  Memory: exclusive writer lock + working copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace piecework::db
