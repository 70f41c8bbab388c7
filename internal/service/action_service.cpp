#include "action_service.hpp"

#include "internal/model/conversions.hpp"
#include "internal/optimization/optimization_service.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"

namespace autopilot::service {

using namespace autopilot::v1;

namespace {

constexpr const char* kDefaultActor = "api";

const std::string& RequireActionId(const std::string& action_id) {
  if (action_id.empty()) {
    throw util::ValidationError("action_id is required");
  }
  return action_id;
}

std::string ActorOr(const std::string& actor) {
  return actor.empty() ? kDefaultActor : actor;
}

} // namespace

ActionService::ActionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListActionsResponse ActionService::ListActions(const ListActionsRequest& req) {
  return ObserveRpc("OptimizationService.ListActions", [&] {
    optimization::ActionQuery query;
    query.campaign_id = req.campaign_id();
    query.target_id   = req.target_id();
    query.limit       = req.limit();
    for (const auto status : req.statuses()) {
      query.statuses.push_back(model::FromProto(static_cast<autopilot::v1::ActionStatus>(status)));
    }
    if (req.type() != ACTION_TYPE_UNSPECIFIED) {
      query.type = model::FromProto(req.type());
    }

    ListActionsResponse resp;
    for (const auto& action : ctx_.optimizer->ListActions(query)) {
      *resp.add_actions() = ToProto(action);
    }
    return resp;
  });
}

OptimizationAction ActionService::GetAction(const GetActionRequest& req) {
  return ObserveRpc("OptimizationService.GetAction", "action.id", req.action_id(),
                    [&] { return ToProto(ctx_.optimizer->GetAction(RequireActionId(req.action_id()))); });
}

OptimizationAction ActionService::ApproveAction(const ApproveActionRequest& req) {
  return ObserveRpc("OptimizationService.ApproveAction", "action.id", req.action_id(), [&] {
    return ToProto(ctx_.optimizer->ApproveAction(RequireActionId(req.action_id()), ActorOr(req.approved_by())));
  });
}

ExecuteActionResponse ActionService::ExecuteAction(const ExecuteActionRequest& req) {
  return ObserveRpc("OptimizationService.ExecuteAction", "action.id", req.action_id(), [&] {
    const auto& action_id = RequireActionId(req.action_id());

    ExecuteActionResponse resp;
    if (!req.dry_run()) {
      const auto action = ctx_.optimizer->GetAction(action_id);
      if (action.status == model::ActionStatus::kSuggested || action.status == model::ActionStatus::kPending) {
        const auto verdict = ctx_.optimizer->Vet(action, false);
        if (!verdict.Passed()) {
          *resp.mutable_action() = ToProto(action);
          resp.mutable_result()->set_status("blocked");
          resp.mutable_result()->set_message(verdict.reason);
          return resp;
        }
      }
    }

    auto outcome           = ctx_.optimizer->ExecuteAction(action_id, ActorOr(req.run_by()), req.dry_run());
    *resp.mutable_action() = ToProto(outcome.action);
    *resp.mutable_result() = std::move(outcome.result);
    return resp;
  });
}

OptimizationAction ActionService::CancelAction(const CancelActionRequest& req) {
  return ObserveRpc("OptimizationService.CancelAction", "action.id", req.action_id(), [&] {
    return ToProto(ctx_.optimizer->CancelAction(RequireActionId(req.action_id()), ActorOr(req.cancelled_by())));
  });
}

RunOptimizationResponse ActionService::RunOptimization(const RunOptimizationRequest& req) {
  return ObserveRpc("OptimizationService.RunOptimization", [&] {
    const std::vector<std::string> ids(req.campaign_ids().begin(), req.campaign_ids().end());

    const auto summary = ctx_.optimizer->RunOptimization(ids, req.dry_run(), ActorOr(req.created_by()));

    RunOptimizationResponse resp;
    resp.set_campaigns_evaluated(summary.campaigns_evaluated);
    resp.set_actions_enqueued(summary.actions_enqueued);
    for (const auto& action : summary.actions) {
      *resp.add_actions() = ToProto(action);
    }
    return resp;
  });
}

QueueStats ActionService::GetQueueStats(const GetQueueStatsRequest&) {
  return ObserveRpc("OptimizationService.GetQueueStats", [&] { return ctx_.optimizer->QueueStats(); });
}

} // namespace autopilot::service
