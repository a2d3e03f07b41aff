#include "memory_tx.hpp"

#include <stdexcept>

namespace ingest::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), write_lock_(repo.write_mutex_) {
  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  write_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (write_lock_.owns_lock()) {
    write_lock_.unlock();
  }
}

} // namespace ingest::db::memory
