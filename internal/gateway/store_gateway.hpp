#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/gateway/ad_platform_gateway.hpp"
#include "internal/util/time.hpp"

namespace autopilot::gateway {

/*
  StoreGateway

  Applies changes straight to the entity rows in the data store. Used
  when no live ad platform is wired in, and by tests.

  A repeated action id is answered with an "already applied" receipt as
  long as it is still remembered: ids are forgotten once they are older
  than replay_window or when more than max_remembered are held, oldest
  first.
*/
class StoreGateway final : public AdPlatformGateway {
 public:
  static constexpr std::size_t kDefaultMaxRemembered = 10'000;

  StoreGateway(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
               std::chrono::hours replay_window = std::chrono::hours(48), std::size_t max_remembered = kDefaultMaxRemembered);

  GatewayReceipt UpdateBudget(const std::string& action_id, const std::string& entity_id, double new_daily_budget_usd) override;
  GatewayReceipt SetStatus(const std::string& action_id, const std::string& entity_id, const std::string& status) override;
  GatewayReceipt ApplyReallocation(const std::string& action_id, const autopilot::v1::ReallocationPlan& plan) override;
  GatewayReceipt SwapCreative(const std::string& action_id, const std::string& ad_id, const std::string& creative_id) override;

 private:
  bool AlreadyApplied(const std::string& action_id);
  void MarkApplied(const std::string& action_id);
  // caller holds applied_mutex_
  void Forget(uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  uint64_t                        replay_window_ms_;
  std::size_t                     max_remembered_;

  std::mutex                                   applied_mutex_;
  std::unordered_map<std::string, uint64_t>    applied_;
  std::deque<std::pair<uint64_t, std::string>> applied_order_;
};

} // namespace autopilot::gateway
