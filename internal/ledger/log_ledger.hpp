#pragma once

#include "internal/ledger/event_ledger.hpp"

namespace autopilot::ledger {

// Writes each event as a structured log line.
class LogLedger final : public EventLedger {
 public:
  void Append(const LedgerEvent& event) override;
};

} // namespace autopilot::ledger
