#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "autopilot/v1.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/autonomous_server.hpp"
#include "internal/grpc/optimization_server.hpp"
#include "internal/service/action_service.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/service/autonomous_service.hpp"
#include "support/fixture.hpp"

namespace {

using autopilot::model::ActionType;
using autopilot::testing::Harness;
using autopilot::testing::MakeAction;
using autopilot::testing::MakeHarness;

std::shared_ptr<autopilot::service::ActionService> ActionServiceFor(const Harness& h) {
  return std::make_shared<autopilot::service::ActionService>(h.Context());
}

void TestGetMissingActionReturnsNotFound() {
  auto h = MakeHarness();
  autopilot::grpc::OptimizationServer server(ActionServiceFor(h));

  autopilot::v1::GetActionRequest req;
  req.set_action_id("missing-action");
  autopilot::v1::OptimizationAction resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.GetAction(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptyActionIdReturnsInvalidArgument() {
  auto h = MakeHarness();
  autopilot::grpc::OptimizationServer server(ActionServiceFor(h));

  autopilot::v1::ApproveActionRequest req;
  autopilot::v1::OptimizationAction   resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.ApproveAction(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestApproveExecutedActionReturnsFailedPrecondition() {
  auto h = MakeHarness();
  autopilot::testing::SeedCampaign(*h.repository, "c-1", h.clock->Now() - std::chrono::hours(72));
  autopilot::testing::SeedAd(*h.repository, "c-1", "ad-1", 100.0, h.clock->Now() - std::chrono::hours(72));

  const auto queued = h.optimizer->EnqueueAction(MakeAction(ActionType::kScaleDown, "c-1", "ad-1", -0.1, 100.0), "test");
  (void)h.optimizer->ExecuteAction(queued.action_id, "test");

  autopilot::grpc::OptimizationServer server(ActionServiceFor(h));

  autopilot::v1::ApproveActionRequest req;
  req.set_action_id(queued.action_id);
  req.set_approved_by("ops");
  autopilot::v1::OptimizationAction resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.ApproveAction(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestBlockedExecutionReturnsOkWithBlockedResult() {
  auto h = MakeHarness();
  // inside the embargo window
  autopilot::testing::SeedCampaign(*h.repository, "c-new", h.clock->Now() - std::chrono::hours(5));
  autopilot::testing::SeedAd(*h.repository, "c-new", "ad-new", 100.0, h.clock->Now() - std::chrono::hours(5));

  const auto queued = h.optimizer->EnqueueAction(MakeAction(ActionType::kScaleUp, "c-new", "ad-new", 0.1, 100.0), "test");

  autopilot::grpc::OptimizationServer server(ActionServiceFor(h));

  autopilot::v1::ExecuteActionRequest req;
  req.set_action_id(queued.action_id);
  autopilot::v1::ExecuteActionResponse resp;
  ::grpc::ServerContext                grpc_ctx;

  const auto status = server.ExecuteAction(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.result().status() == "blocked");
  assert(resp.action().status() == autopilot::v1::ACTION_STATUS_SUGGESTED);
}

void TestSetModeRequiresKnownMode() {
  auto h = MakeHarness();
  autopilot::grpc::AutonomousServer server(std::make_shared<autopilot::service::AutonomousService>(h.Context()));

  autopilot::v1::SetModeRequest req;
  autopilot::v1::WorkerStatus   resp;
  ::grpc::ServerContext         grpc_ctx;

  assert(server.SetMode(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_mode(autopilot::v1::WORKER_MODE_AUTO);
  assert(server.SetMode(&grpc_ctx, &req, &resp).ok());
  assert(resp.mode() == autopilot::v1::WORKER_MODE_AUTO);
  assert(h.worker->Mode() == autopilot::config::WorkerMode::kAuto);
}

void TestUnknownAttributionModelReturnsInvalidArgument() {
  auto h = MakeHarness();
  autopilot::grpc::AnalyticsServer server(std::make_shared<autopilot::service::AnalyticsService>(h.Context()));

  autopilot::v1::ApplyAttributionRequest req;
  req.mutable_scope()->set_campaign_id("c-1");
  *req.mutable_date_start() = autopilot::util::ToProto(h.clock->Now() - std::chrono::hours(24));
  *req.mutable_date_end()   = autopilot::util::ToProto(h.clock->Now());
  req.set_model("first_touch_plus");
  autopilot::v1::ApplyAttributionResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  assert(server.ApplyAttribution(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_model("linear");
  assert(server.ApplyAttribution(&grpc_ctx, &req, &resp).ok());
  assert(resp.outcomes_updated() == 0);
}

void TestRecordingMetricsTwiceReturnsAlreadyExists() {
  auto h = MakeHarness();
  autopilot::grpc::AnalyticsServer server(std::make_shared<autopilot::service::AnalyticsService>(h.Context()));

  autopilot::v1::RecordDailyMetricsRequest req;
  req.mutable_scope()->set_ad_id("ad-1");
  *req.mutable_day() = autopilot::util::ToProto(h.clock->Now() - std::chrono::hours(24));
  autopilot::v1::RoasMetrics resp;
  ::grpc::ServerContext      grpc_ctx;

  assert(server.RecordDailyMetrics(&grpc_ctx, &req, &resp).ok());
  assert(server.RecordDailyMetrics(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  autopilot::v1::RecordDailyMetricsRequest no_scope;
  assert(server.RecordDailyMetrics(&grpc_ctx, &no_scope, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCalculateRoasWithoutDataReturnsOk() {
  auto h = MakeHarness();
  autopilot::grpc::AnalyticsServer server(std::make_shared<autopilot::service::AnalyticsService>(h.Context()));

  autopilot::v1::CalculateRoasRequest req;
  req.mutable_scope()->set_campaign_id("c-empty");
  autopilot::v1::RoasResult resp;
  ::grpc::ServerContext     grpc_ctx;

  assert(server.CalculateRoas(&grpc_ctx, &req, &resp).ok());
  assert(resp.actual_roas() == 0.0);
  assert(resp.total_cost_usd() == 0.0);
}

} // namespace

int main() {
  TestGetMissingActionReturnsNotFound();
  TestEmptyActionIdReturnsInvalidArgument();
  TestApproveExecutedActionReturnsFailedPrecondition();
  TestBlockedExecutionReturnsOkWithBlockedResult();
  TestSetModeRequiresKnownMode();
  TestUnknownAttributionModelReturnsInvalidArgument();
  TestRecordingMetricsTwiceReturnsAlreadyExists();
  TestCalculateRoasWithoutDataReturnsOk();

  std::cout << "autopilot_unit_grpc_status: pass\n";
  return 0;
}
