#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace autopilot::db::memory {

/*
  Transaction = snapshot + write set

  Read-only transactions never conflict; a writer whose snapshot is
  older than the committed version throws util::Conflict on Commit().
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

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace autopilot::db::memory
