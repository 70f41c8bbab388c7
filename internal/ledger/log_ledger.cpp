#include "log_ledger.hpp"

#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/observability/logging.hpp"

namespace autopilot::ledger {

void LogLedger::Append(const LedgerEvent& event) {
  std::string payload;
  auto        status = google::protobuf::util::MessageToJsonString(event.payload, &payload);
  if (!status.ok()) payload = "{}";

  AUTOPILOT_LOG_INFO("Ledger event", {observability::StringField("event_type", event.event_type),
                                      observability::StringField("action_id", event.action_id),
                                      observability::StringField("entity_id", event.entity_id), observability::StringField("actor", event.actor),
                                      observability::StringField("at", util::ToIso8601(event.at)), observability::StringField("payload", payload)});
}

} // namespace autopilot::ledger
