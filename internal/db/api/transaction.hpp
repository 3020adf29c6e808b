#pragma once

namespace roster::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws DbError when the backend refuses the write set

  SQLite: BEGIN IMMEDIATE under the connection's transaction lock
  Postgres: pqxx::work with a local statement_timeout
  Memory: snapshot + write log replayed at commit
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

}
