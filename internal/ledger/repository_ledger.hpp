#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/event_ledger.hpp"

namespace autopilot::ledger {

// Persists events as ledger_events rows, each in its own transaction.
class RepositoryLedger final : public EventLedger {
 public:
  explicit RepositoryLedger(std::shared_ptr<db::Repository> repository, uint32_t max_attempts = 3);

  void Append(const LedgerEvent& event) override;

 private:
  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_attempts_;
};

} // namespace autopilot::ledger
