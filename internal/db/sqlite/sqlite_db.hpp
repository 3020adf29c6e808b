#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace roster::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; TransactionLock()
  serializes them so BEGIN/COMMIT pairs never interleave.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Waits at most busy_timeout; throws DbError(Timeout) otherwise.
  std::unique_lock<std::timed_mutex> TransactionLock();

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          tx_mutex_;
};

} // namespace roster::db::sqlite
