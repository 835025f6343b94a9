#include "memory_tx.hpp"

#include <stdexcept>

namespace rollout::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::runtime_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace rollout::db::memory
