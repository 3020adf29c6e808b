#pragma once

#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace roster::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot taken at Begin() plus this transaction's writes.
  Commit() replays the log against the latest committed state; a write that
  no longer applies (uniqueness broken by a concurrent commit) aborts the
  whole transaction with DbError(ConstraintViolation).
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void Record(MemoryRepository::WriteOp op) {
    log_.push_back(std::move(op));
  }

 private:
  MemoryRepository&                      repo_;
  MemoryRepository::State                working_;
  std::vector<MemoryRepository::WriteOp> log_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace roster::db::memory
