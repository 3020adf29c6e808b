#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace roster::db::postgres {

// Maps libpqxx exceptions onto store error codes.
Result Translate(const std::exception& e);

// Read-committed work unit; statement_timeout bounds every statement,
// including row-lock waits.
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
};

}
