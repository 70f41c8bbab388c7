#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace autopilot::ledger {

inline constexpr std::string_view kOptimizationSuggested  = "optimization_suggested";
inline constexpr std::string_view kOptimizationApproved   = "optimization_approved";
inline constexpr std::string_view kOptimizationExecuted   = "optimization_executed";
inline constexpr std::string_view kOptimizationFailed     = "optimization_failed";
inline constexpr std::string_view kOptimizationCancelled  = "optimization_cancelled";
inline constexpr std::string_view kOptimizationExpired    = "optimization_expired";
inline constexpr std::string_view kAutonomousTickComplete = "autonomous_tick_completed";

struct LedgerEvent {
  std::string event_type;
  std::string action_id;
  std::string entity_id;
  std::string actor;

  google::protobuf::Struct payload;
  util::TimePoint          at;
};

/*
  Append-only audit sink.

  Append may throw; callers on a primary path go through Notify so a
  ledger failure never aborts the operation that produced the event.
*/
class EventLedger {
 public:
  virtual ~EventLedger() = default;

  virtual void Append(const LedgerEvent& event) = 0;
};

// Fire-and-forget. Failures are logged at warn and dropped.
void Notify(EventLedger* ledger, const LedgerEvent& event);

inline void Notify(const std::shared_ptr<EventLedger>& ledger, const LedgerEvent& event) {
  Notify(ledger.get(), event);
}

} // namespace autopilot::ledger
