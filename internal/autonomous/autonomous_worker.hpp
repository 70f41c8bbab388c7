#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "autopilot/v1/types.pb.h"
#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/event_ledger.hpp"
#include "internal/optimization/optimization_service.hpp"

namespace autopilot::autonomous {

struct WorkerSnapshot {
  bool                                    enabled    = false;
  bool                                    is_running = false;
  config::WorkerMode                      mode       = config::WorkerMode::kSuggest;
  std::optional<autopilot::v1::TickStats> last_tick;
};

/*
  Control loop over eligible campaigns.

  Each tick:
      expire stale suggestions
      evaluate ACTIVE, post-embargo campaigns
      vet every candidate (policy, then safety)
      auto-execute the safe ones in auto mode, queue the rest

  One campaign failing never aborts the tick. Ticks are serialized, so a
  manual RunOnce never overlaps the background loop.
*/
class AutonomousWorker {
 public:
  AutonomousWorker(config::Settings settings, std::shared_ptr<db::Repository> repository,
                   std::shared_ptr<optimization::OptimizationService> optimizer, std::shared_ptr<ledger::EventLedger> ledger,
                   std::shared_ptr<util::Clock> clock);
  ~AutonomousWorker();

  AutonomousWorker(const AutonomousWorker&)            = delete;
  AutonomousWorker& operator=(const AutonomousWorker&) = delete;

  void Start();
  // Returns after the in-flight tick (if any) finishes.
  void Stop();
  bool IsRunning() const;

  autopilot::v1::TickStats RunOnce();

  void               SetMode(config::WorkerMode mode);
  config::WorkerMode Mode() const;

  WorkerSnapshot          Status() const;
  const config::Settings& Settings() const {
    return settings_;
  }

  // Pause always; reallocate never; otherwise high confidence and a small change.
  bool IsSafeForAuto(const db::model::ActionRecord& action) const;

 private:
  void Run();
  void ProcessCampaign(const db::model::EntityRecord& campaign, autopilot::v1::TickStats& stats);

  config::Settings                                   settings_;
  std::shared_ptr<db::Repository>                    repository_;
  std::shared_ptr<optimization::OptimizationService> optimizer_;
  std::shared_ptr<ledger::EventLedger>               ledger_;
  std::shared_ptr<util::Clock>                       clock_;

  std::atomic<config::WorkerMode> mode_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  mutable std::mutex      mutex_;
  std::condition_variable wake_;

  std::mutex                              tick_mutex_;
  std::optional<autopilot::v1::TickStats> last_tick_; // guarded by mutex_
};

} // namespace autopilot::autonomous
