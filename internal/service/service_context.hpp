#pragma once

#include <memory>

namespace autopilot::db {
class Repository;
}
namespace autopilot::util {
class Clock;
}
namespace autopilot::analytics {
class RoasCalculator;
class PredictionEngine;
class MetricsRecorder;
class BudgetAllocator;
} // namespace autopilot::analytics
namespace autopilot::optimization {
class OptimizationService;
}
namespace autopilot::autonomous {
class AutonomousWorker;
}

namespace autopilot::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<autopilot::db::Repository>                    repository;
  std::shared_ptr<autopilot::util::Clock>                       clock;
  std::shared_ptr<autopilot::analytics::RoasCalculator>         calculator;
  std::shared_ptr<autopilot::analytics::PredictionEngine>       prediction;
  std::shared_ptr<autopilot::analytics::MetricsRecorder>        recorder;
  std::shared_ptr<autopilot::analytics::BudgetAllocator>        allocator;
  std::shared_ptr<autopilot::optimization::OptimizationService> optimizer;
  std::shared_ptr<autopilot::autonomous::AutonomousWorker>      worker;
};

} // namespace autopilot::service
