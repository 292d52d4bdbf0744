#pragma once

namespace roster::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A thread must finish (commit or rollback) one transaction
    before it begins the next one

  SQLite: BEGIN IMMEDIATE on a serialized connection
  Postgres: pqxx::work on a pooled connection
  Memory: store mutex held for the lifetime + snapshot for rollback
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

/*
  Per-league advisory lock.

  Acquired without blocking through Repository::TryLockLeague and
  released when the handle is destroyed.
*/
class LeagueLock {
 public:
  virtual ~LeagueLock() = default;
};

} // namespace roster::db
