#pragma once

#include <cstdint>
#include <vector>

#include "autopilot/v1/types.pb.h"
#include "internal/config/settings.hpp"
#include "internal/db/model/roas_metrics_record.hpp"

namespace autopilot::analytics {

struct WinnersLosers {
  std::vector<db::model::RoasMetricsRecord> winners;
  std::vector<db::model::RoasMetricsRecord> losers;
  double                                    median_roas    = 0.0;
  uint64_t                                  total_analyzed = 0;
};

/*
  BudgetAllocator

  Proportional split of a budget across ads by roas * confidence.
  Ads below pause_roas get nothing; ads below scale_down_max_roas get
  half weight. Outliers and low-confidence rows are left out.
*/
class BudgetAllocator {
 public:
  static constexpr size_t kMaxRanked = 10;

  BudgetAllocator(config::OptimizerSettings optimizer, uint32_t min_sample_size);

  autopilot::v1::ReallocationPlan ComputeReallocations(const std::vector<db::model::RoasMetricsRecord>& rows, double total_budget) const;

  // Winners >= 1.5x median, losers <= 0.5x median; rows below the minimum
  // sample size do not count.
  WinnersLosers DetectWinnersLosers(const std::vector<db::model::RoasMetricsRecord>& rows) const;

 private:
  config::OptimizerSettings optimizer_;
  uint32_t                  min_sample_size_;
};

} // namespace autopilot::analytics
