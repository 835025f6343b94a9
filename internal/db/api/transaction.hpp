#pragma once

namespace rollout::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Transactions are serialized: at most one is open per repository, so a
    thread must never open a second transaction while holding one.

  SQLite: BEGIN IMMEDIATE under the connection's transaction mutex
  Postgres: pqxx::work (SERIALIZABLE)
  Memory: snapshot copy under the repository lock
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

} // namespace rollout::db
