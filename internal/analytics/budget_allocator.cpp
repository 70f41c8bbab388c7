#include "budget_allocator.hpp"

#include <algorithm>

namespace autopilot::analytics {

BudgetAllocator::BudgetAllocator(config::OptimizerSettings optimizer, uint32_t min_sample_size)
    : optimizer_(std::move(optimizer)), min_sample_size_(min_sample_size) {
}

autopilot::v1::ReallocationPlan BudgetAllocator::ComputeReallocations(const std::vector<db::model::RoasMetricsRecord>& rows,
                                                                      double total_budget) const {
  std::vector<autopilot::v1::BudgetAllocation> allocations;
  double                                       total_weight = 0.0;

  for (const auto& row : rows) {
    if (row.is_outlier || row.confidence_score < optimizer_.reallocation_min_confidence) continue;

    double weight = row.actual_roas * row.confidence_score;
    if (row.actual_roas < optimizer_.pause_roas) {
      weight = 0.0;
    } else if (row.actual_roas < optimizer_.scale_down_max_roas) {
      weight *= 0.5;
    }

    autopilot::v1::BudgetAllocation allocation;
    allocation.set_ad_id(row.scope.ad_id);
    allocation.set_current_roas(row.actual_roas);
    allocation.set_confidence(row.confidence_score);
    allocation.set_weight(weight);
    allocations.push_back(std::move(allocation));

    total_weight += weight;
  }

  if (total_weight > 0.0) {
    for (auto& allocation : allocations) {
      allocation.set_allocated_budget(allocation.weight() / total_weight * total_budget);
      allocation.set_budget_share_pct(allocation.weight() / total_weight * 100.0);
    }
  }

  std::stable_sort(allocations.begin(), allocations.end(),
                   [](const auto& a, const auto& b) { return a.allocated_budget() > b.allocated_budget(); });

  autopilot::v1::ReallocationPlan plan;
  double                          total_allocated = 0.0;
  for (auto& allocation : allocations) {
    total_allocated += allocation.allocated_budget();
    *plan.add_allocations() = std::move(allocation);
  }
  plan.set_total_budget(total_budget);
  plan.set_total_allocated(total_allocated);
  plan.set_unallocated(total_budget - total_allocated);
  return plan;
}

WinnersLosers BudgetAllocator::DetectWinnersLosers(const std::vector<db::model::RoasMetricsRecord>& rows) const {
  std::vector<db::model::RoasMetricsRecord> eligible;
  for (const auto& row : rows) {
    if (row.sample_size >= min_sample_size_) eligible.push_back(row);
  }

  WinnersLosers out;
  out.total_analyzed = eligible.size();
  if (eligible.empty()) return out;

  std::stable_sort(eligible.begin(), eligible.end(), [](const auto& a, const auto& b) { return a.actual_roas > b.actual_roas; });

  std::vector<double> roas;
  roas.reserve(eligible.size());
  for (const auto& row : eligible) {
    roas.push_back(row.actual_roas);
  }
  std::sort(roas.begin(), roas.end());
  out.median_roas = roas[roas.size() / 2];

  for (const auto& row : eligible) {
    if (row.actual_roas >= out.median_roas * 1.5) {
      if (out.winners.size() < kMaxRanked) out.winners.push_back(row);
    } else if (row.actual_roas <= out.median_roas * 0.5) {
      if (out.losers.size() < kMaxRanked) out.losers.push_back(row);
    }
  }
  return out;
}

} // namespace autopilot::analytics
