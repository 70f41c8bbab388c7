#pragma once

namespace autopilot::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite:   BEGIN IMMEDIATE (one writer at a time)
  Postgres: pqxx::work
  Memory:   snapshot copy-on-write, Commit() throws util::Conflict
            when another writer committed since the snapshot
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

} // namespace autopilot::db
