#include "event_ledger.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace autopilot::ledger {

void Notify(EventLedger* ledger, const LedgerEvent& event) {
  if (!ledger) return;

  try {
    ledger->Append(event);
  } catch (const std::exception& e) {
    AUTOPILOT_LOG_WARN("Ledger write failed", {observability::StringField("event_type", event.event_type),
                                               observability::StringField("action_id", event.action_id),
                                               observability::StringField("error", e.what())});
  }
}

} // namespace autopilot::ledger
