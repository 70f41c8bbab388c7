#include "repository_ledger.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "internal/db/api/check.hpp"
#include "internal/util/errors.hpp"

namespace autopilot::ledger {

RepositoryLedger::RepositoryLedger(std::shared_ptr<db::Repository> repository, uint32_t max_attempts)
    : repository_(std::move(repository)), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
}

void RepositoryLedger::Append(const LedgerEvent& event) {
  db::model::LedgerEventRecord record;
  record.event_type    = event.event_type;
  record.action_id     = event.action_id;
  record.entity_id     = event.entity_id;
  record.actor         = event.actor;
  record.created_at_ms = util::ToUnixMillis(event.at);

  auto status = google::protobuf::util::MessageToJsonString(event.payload, &record.payload_json);
  if (!status.ok()) {
    throw std::runtime_error("ledger payload encode failed: " + std::string(status.message()));
  }

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->AppendLedgerEvent(*tx, record), "append ledger event");
      tx->Commit();
      return;
    } catch (const util::Conflict&) {
      if (attempt >= max_attempts_) throw;
    }
  }
}

} // namespace autopilot::ledger
