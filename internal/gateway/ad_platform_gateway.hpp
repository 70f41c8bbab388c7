#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include "autopilot/v1/types.pb.h"

namespace autopilot::gateway {

// Raised by a gateway when the platform rejects or cannot apply a change.
class GatewayError : public std::runtime_error {
 public:
  explicit GatewayError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct GatewayReceipt {
  bool                               accepted = false;
  std::string                        message;
  std::map<std::string, std::string> details;
};

/*
  Ad-platform gateway.

  Every call carries the action_id as an idempotency key: replaying a
  call for an action that was already applied is a no-op that still
  reports success. Failures are thrown as GatewayError.
*/
class AdPlatformGateway {
 public:
  virtual ~AdPlatformGateway() = default;

  virtual GatewayReceipt UpdateBudget(const std::string& action_id, const std::string& entity_id, double new_daily_budget_usd) = 0;

  virtual GatewayReceipt SetStatus(const std::string& action_id, const std::string& entity_id, const std::string& status) = 0;

  virtual GatewayReceipt ApplyReallocation(const std::string& action_id, const autopilot::v1::ReallocationPlan& plan) = 0;

  virtual GatewayReceipt SwapCreative(const std::string& action_id, const std::string& ad_id, const std::string& creative_id) = 0;
};

} // namespace autopilot::gateway
