#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "autopilot/v1.hpp"

using namespace autopilot::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  autopilotctl <addr> list [campaign_id]\n"
            << "  autopilotctl <addr> get <action_id>\n"
            << "  autopilotctl <addr> approve <action_id> [by]\n"
            << "  autopilotctl <addr> execute <action_id> [--dry-run] [by]\n"
            << "  autopilotctl <addr> cancel <action_id> [by]\n"
            << "  autopilotctl <addr> run [--dry-run] [campaign_id...]\n"
            << "  autopilotctl <addr> queue-stats\n"
            << "  autopilotctl <addr> tick\n"
            << "  autopilotctl <addr> status\n"
            << "  autopilotctl <addr> policies\n"
            << "  autopilotctl <addr> mode <suggest|auto>\n"
            << "  autopilotctl <addr> start|stop\n"
            << "  autopilotctl <addr> roas <campaign_id> [ad_id]\n"
            << "  autopilotctl <addr> predict <campaign_id> [lookback_days]\n"
            << "  autopilotctl <addr> conv-prob <clicks> <conversions>\n"
            << "  autopilotctl <addr> ev <probability> <avg_order_value> <cost_per_click>\n"
            << "  autopilotctl <addr> attribute <campaign_id> <last_click|first_click|linear|time_decay> [days=30]\n"
            << "  autopilotctl <addr> record <campaign_id> [ad_id]\n"
            << "  autopilotctl <addr> budget-plan <campaign_id> [total_budget] [lookback_days]\n";
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  const auto  converted = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!converted.ok()) {
    std::cerr << "failed to render response\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static Scope MakeScope(int argc, char** argv, int first) {
  Scope scope;
  if (argc > first) scope.set_campaign_id(argv[first]);
  if (argc > first + 1) scope.set_ad_id(argv[first + 1]);
  return scope;
}

static std::optional<WorkerMode> ParseMode(const std::string& value) {
  if (value == "suggest") {
    return WORKER_MODE_SUGGEST;
  }
  if (value == "auto") {
    return WORKER_MODE_AUTO;
  }
  return std::nullopt;
}

static google::protobuf::Timestamp FromSystemTime(std::chrono::system_clock::time_point tp) {
  const auto                  ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  google::protobuf::Timestamp ts;
  ts.set_seconds(ms / 1000);
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto optimization_stub = OptimizationService::NewStub(channel);
  auto autonomous_stub   = AutonomousService::NewStub(channel);
  auto analytics_stub    = AnalyticsService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Action queue
  // ------------------------------------------------------------

  if (cmd == "list") {
    ListActionsRequest req;
    if (argc >= 4) req.set_campaign_id(argv[3]);

    ListActionsResponse resp;
    return Print(optimization_stub->ListActions(&ctx, req, &resp), resp);
  }

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetActionRequest req;
    req.set_action_id(argv[3]);

    OptimizationAction resp;
    return Print(optimization_stub->GetAction(&ctx, req, &resp), resp);
  }

  if (cmd == "approve") {
    if (argc < 4) return 1;

    ApproveActionRequest req;
    req.set_action_id(argv[3]);
    req.set_approved_by(argc >= 5 ? argv[4] : "autopilotctl");

    OptimizationAction resp;
    return Print(optimization_stub->ApproveAction(&ctx, req, &resp), resp);
  }

  if (cmd == "execute") {
    if (argc < 4) return 1;

    ExecuteActionRequest req;
    req.set_action_id(argv[3]);
    req.set_run_by("autopilotctl");
    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--dry-run") {
        req.set_dry_run(true);
      } else {
        req.set_run_by(arg);
      }
    }

    ExecuteActionResponse resp;
    return Print(optimization_stub->ExecuteAction(&ctx, req, &resp), resp);
  }

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelActionRequest req;
    req.set_action_id(argv[3]);
    req.set_cancelled_by(argc >= 5 ? argv[4] : "autopilotctl");

    OptimizationAction resp;
    return Print(optimization_stub->CancelAction(&ctx, req, &resp), resp);
  }

  if (cmd == "run") {
    RunOptimizationRequest req;
    req.set_created_by("autopilotctl");
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--dry-run") {
        req.set_dry_run(true);
      } else {
        req.add_campaign_ids(arg);
      }
    }

    RunOptimizationResponse resp;
    return Print(optimization_stub->RunOptimization(&ctx, req, &resp), resp);
  }

  if (cmd == "queue-stats") {
    GetQueueStatsRequest req;
    QueueStats           resp;
    return Print(optimization_stub->GetQueueStats(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Worker control
  // ------------------------------------------------------------

  if (cmd == "tick") {
    RunOnceRequest req;
    TickStats      resp;
    return Print(autonomous_stub->RunOnce(&ctx, req, &resp), resp);
  }

  if (cmd == "status") {
    GetStatusRequest req;
    WorkerStatus     resp;
    return Print(autonomous_stub->GetStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "policies") {
    GetPoliciesRequest req;
    PolicySettings     resp;
    return Print(autonomous_stub->GetPolicies(&ctx, req, &resp), resp);
  }

  if (cmd == "mode") {
    if (argc < 4) return 1;

    auto mode = ParseMode(argv[3]);
    if (!mode.has_value()) {
      std::cerr << "unsupported mode: " << argv[3] << "\n";
      return 1;
    }

    SetModeRequest req;
    req.set_mode(mode.value());

    WorkerStatus resp;
    return Print(autonomous_stub->SetMode(&ctx, req, &resp), resp);
  }

  if (cmd == "start" || cmd == "stop") {
    WorkerControlRequest req;
    WorkerStatus         resp;
    auto status = cmd == "start" ? autonomous_stub->StartWorker(&ctx, req, &resp) : autonomous_stub->StopWorker(&ctx, req, &resp);
    return Print(status, resp);
  }

  // ------------------------------------------------------------
  // Analytics
  // ------------------------------------------------------------

  if (cmd == "roas") {
    if (argc < 4) return 1;

    CalculateRoasRequest req;
    *req.mutable_scope() = MakeScope(argc, argv, 3);

    RoasResult resp;
    return Print(analytics_stub->CalculateRoas(&ctx, req, &resp), resp);
  }

  if (cmd == "predict") {
    if (argc < 4) return 1;

    PredictRoasRequest req;
    req.mutable_scope()->set_campaign_id(argv[3]);
    if (argc >= 5) req.set_lookback_days(static_cast<uint32_t>(std::stoul(argv[4])));

    PredictRoasResponse resp;
    return Print(analytics_stub->PredictRoas(&ctx, req, &resp), resp);
  }

  if (cmd == "conv-prob") {
    if (argc < 5) return 1;

    ConversionProbabilityRequest req;
    req.set_clicks(std::stoull(argv[3]));
    req.set_conversions(std::stoull(argv[4]));

    ConversionProbabilityResponse resp;
    return Print(analytics_stub->ConversionProbability(&ctx, req, &resp), resp);
  }

  if (cmd == "ev") {
    if (argc < 6) return 1;

    ExpectedValueRequest req;
    req.set_conversion_probability(std::stod(argv[3]));
    req.set_avg_order_value(std::stod(argv[4]));
    req.set_cost_per_click(std::stod(argv[5]));

    ExpectedValueResponse resp;
    return Print(analytics_stub->ExpectedValue(&ctx, req, &resp), resp);
  }

  if (cmd == "attribute") {
    if (argc < 5) return 1;

    const int  days = argc >= 6 ? std::stoi(argv[5]) : 30;
    const auto now  = std::chrono::system_clock::now();

    ApplyAttributionRequest req;
    req.mutable_scope()->set_campaign_id(argv[3]);
    req.set_model(argv[4]);
    *req.mutable_date_start() = FromSystemTime(now - std::chrono::hours(24 * days));
    *req.mutable_date_end()   = FromSystemTime(now);

    ApplyAttributionResponse resp;
    return Print(analytics_stub->ApplyAttribution(&ctx, req, &resp), resp);
  }

  if (cmd == "record") {
    if (argc < 4) return 1;

    RecordDailyMetricsRequest req;
    *req.mutable_scope() = MakeScope(argc, argv, 3);

    RoasMetrics resp;
    return Print(analytics_stub->RecordDailyMetrics(&ctx, req, &resp), resp);
  }

  if (cmd == "budget-plan") {
    if (argc < 4) return 1;

    GetBudgetPlanRequest req;
    req.set_campaign_id(argv[3]);
    if (argc >= 5) req.set_total_budget(std::stod(argv[4]));
    if (argc >= 6) req.set_lookback_days(static_cast<uint32_t>(std::stoul(argv[5])));

    GetBudgetPlanResponse resp;
    return Print(analytics_stub->GetBudgetPlan(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
