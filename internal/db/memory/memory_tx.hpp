#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace hsm::db::memory {

/*
  Transaction = snapshot + write set

  The first write takes the repository's writer lock and re-snapshots, so
  writers are serialised the way SQLite's BEGIN IMMEDIATE serialises them.
  Reads before that first write see the snapshot taken at Begin(). The
  writer lock is held until Commit() or Rollback(); one thread must not
  hold two writing transactions at once.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::unique_lock<std::mutex> writer_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace hsm::db::memory
