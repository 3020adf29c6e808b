#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/api/result.hpp"

namespace roster::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)), busy_timeout_(busy_timeout) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    const auto primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
      throw DbError(ErrorCode::Busy, msg);
    }
    throw DbError(ErrorCode::InternalError, msg);
  }
}

std::unique_lock<std::timed_mutex> SqliteDB::TransactionLock() {
  std::unique_lock lock(tx_mutex_, std::defer_lock);
  if (!lock.try_lock_for(busy_timeout_)) {
    throw DbError(ErrorCode::Timeout, "timed out waiting for sqlite transaction lock on " + path_);
  }
  return lock;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace roster::db::sqlite
