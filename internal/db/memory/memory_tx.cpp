#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace portwatch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write attempted in a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (read_only_) {
    committed_ = true;
    return;
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StoreUnavailable("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace portwatch::db::memory
