#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace hsm::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  if (!dirty_) {
    writer_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);

    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      working_          = repo_.committed_;
      snapshot_version_ = repo_.committed_version_;
    }
    dirty_ = true;
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  if (!dirty_) {
    committed_ = true;
    return;
  }

  {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      throw util::InvalidState("transaction conflict: state was modified by a concurrent transaction");
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
  }
  committed_ = true;
  writer_    = {};
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  writer_      = {};
}

} // namespace hsm::db::memory
