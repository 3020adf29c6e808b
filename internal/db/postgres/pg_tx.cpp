#include "pg_tx.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace roster::db::postgres {

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::foreign_key_violation*>(&e) ||
      dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::query_canceled*>(&e)) {
    return Result::Err(ErrorCode::Timeout, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (auto* db = dynamic_cast<const DbError*>(&e)) {
    return Result::Err(db->code(), e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  if (statement_timeout.count() > 0) {
    tx_->exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout.count()));
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      spdlog::warn("postgres abort failed: {}", e.what());
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    committed_ = true;
    throw DbError(Translate(e));
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

}
