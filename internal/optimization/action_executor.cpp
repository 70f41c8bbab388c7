#include "action_executor.hpp"

#include <cmath>
#include <string>

#include "internal/db/model/entity_record.hpp"
#include "internal/util/format.hpp"

namespace autopilot::optimization {

using autopilot::model::ActionType;
using autopilot::v1::ExecutionResult;

namespace {

ExecutionResult Executed(std::string message, const gateway::GatewayReceipt& receipt) {
  ExecutionResult result;
  result.set_status("executed");
  result.set_message(std::move(message));
  result.set_platform_accepted(receipt.accepted);
  for (const auto& [key, value] : receipt.details) {
    (*result.mutable_details())[key] = value;
  }
  if (!receipt.message.empty()) (*result.mutable_details())["platform_message"] = receipt.message;
  return result;
}

void AddBudgets(ExecutionResult& result, const db::model::ActionRecord& action) {
  (*result.mutable_details())["old_budget"] = util::FormatFixed(action.old_budget_usd, 2);
  (*result.mutable_details())["new_budget"] = util::FormatFixed(action.new_budget_usd, 2);
}

} // namespace

ActionExecutor::ActionExecutor(std::shared_ptr<gateway::AdPlatformGateway> gateway) : gateway_(std::move(gateway)) {
}

ExecutionResult ActionExecutor::Execute(const db::model::ActionRecord& action) {
  switch (action.type) {
    case ActionType::kScaleUp:
      return ScaleUp(action);
    case ActionType::kScaleDown:
      return ScaleDown(action);
    case ActionType::kPause:
      return Pause(action);
    case ActionType::kResume:
      return Resume(action);
    case ActionType::kReallocate:
      return Reallocate(action);
    case ActionType::kUnspecified:
      break;
  }
  throw gateway::GatewayError("unknown action type for " + action.action_id);
}

ExecutionResult ActionExecutor::ScaleUp(const db::model::ActionRecord& action) {
  const auto receipt = gateway_->UpdateBudget(action.action_id, action.target_id, action.new_budget_usd);

  auto result = Executed("Scaled up " + action.target_id + " by " + util::FormatPercent(action.amount_pct), receipt);
  AddBudgets(result, action);
  return result;
}

ExecutionResult ActionExecutor::ScaleDown(const db::model::ActionRecord& action) {
  const auto receipt = gateway_->UpdateBudget(action.action_id, action.target_id, action.new_budget_usd);

  auto result = Executed("Scaled down " + action.target_id + " by " + util::FormatPercent(std::abs(action.amount_pct)), receipt);
  AddBudgets(result, action);
  return result;
}

ExecutionResult ActionExecutor::Pause(const db::model::ActionRecord& action) {
  const auto receipt = gateway_->SetStatus(action.action_id, action.target_id, db::model::kEntityPaused);

  auto result                          = Executed("Paused " + action.target_id, receipt);
  (*result.mutable_details())["reason"] = action.reason;
  return result;
}

ExecutionResult ActionExecutor::Resume(const db::model::ActionRecord& action) {
  const auto receipt = gateway_->SetStatus(action.action_id, action.target_id, db::model::kEntityActive);
  return Executed("Resumed " + action.target_id, receipt);
}

ExecutionResult ActionExecutor::Reallocate(const db::model::ActionRecord& action) {
  if (!action.reallocation_plan) {
    throw gateway::GatewayError("reallocate action " + action.action_id + " has no reallocation plan");
  }

  const auto receipt = gateway_->ApplyReallocation(action.action_id, *action.reallocation_plan);

  auto result                                = Executed("Reallocated budget for campaign " + action.campaign_id, receipt);
  (*result.mutable_details())["affected_ads"] = std::to_string(action.affected_ad_ids.size());
  return result;
}

} // namespace autopilot::optimization
