#pragma once

#include <cstdint>
#include <string>

namespace autopilot::db::model {

// Append-only audit event. payload_json is opaque to the store.
struct LedgerEventRecord {
  uint64_t    id = 0; // assigned on insert
  std::string event_type;
  std::string action_id;
  std::string entity_id;
  std::string actor;
  std::string payload_json;
  uint64_t    created_at_ms = 0;
};

} // namespace autopilot::db::model
