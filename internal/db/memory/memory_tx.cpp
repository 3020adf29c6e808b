#include "memory_tx.hpp"

#include <stdexcept>

namespace roster::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto             next = repo_.committed_;
  for (auto& op : log_) {
    auto result = op(next);
    if (!result) {
      rolled_back_ = true;
      throw DbError(result.code, "transaction conflict: " + result.message);
    }
  }
  repo_.committed_ = std::move(next);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  log_.clear();
  rolled_back_ = true;
}

} // namespace roster::db::memory
