#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/analytics/attribution_engine.hpp"
#include "internal/analytics/budget_allocator.hpp"
#include "internal/analytics/metrics_recorder.hpp"
#include "internal/analytics/prediction_engine.hpp"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fixture.hpp"

namespace {

using autopilot::analytics::AttributionEngine;
using autopilot::analytics::BudgetAllocator;
using autopilot::analytics::MetricsRecorder;
using autopilot::analytics::PredictionEngine;
using autopilot::analytics::RoasCalculator;
using autopilot::db::model::OutcomeRecord;
using autopilot::db::model::RoasMetricsRecord;
using autopilot::db::model::Scope;
using autopilot::testing::kEpochMs;

constexpr uint64_t kHourMs = 3'600'000ULL;
constexpr uint64_t kDayMs  = 24 * kHourMs;

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) < eps;
}

struct World {
  std::shared_ptr<autopilot::db::memory::MemoryRepository> repository = std::make_shared<autopilot::db::memory::MemoryRepository>();
  std::shared_ptr<autopilot::util::ManualClock>            clock =
      std::make_shared<autopilot::util::ManualClock>(autopilot::util::FromUnixMillis(kEpochMs));
};

Scope CampaignScope(const std::string& id) {
  Scope scope;
  scope.campaign_id = id;
  return scope;
}

void InsertInsight(autopilot::db::Repository& repo, const Scope& scope, uint64_t start_ms, uint64_t impressions, uint64_t clicks, double spend) {
  autopilot::db::model::InsightRecord insight;
  insight.scope         = scope;
  insight.date_start_ms = start_ms;
  insight.date_stop_ms  = start_ms + kHourMs;
  insight.impressions   = impressions;
  insight.clicks        = clicks;
  insight.spend_usd     = spend;

  auto tx = repo.Begin();
  assert(repo.InsertInsight(*tx, insight));
  tx->Commit();
}

void InsertOutcome(autopilot::db::Repository& repo, const std::string& id, const Scope& scope, uint64_t at_ms, double value,
                   const std::string& type = "purchase", const std::string& session = "s-1") {
  OutcomeRecord outcome;
  outcome.outcome_id               = id;
  outcome.scope                    = scope;
  outcome.value_usd                = value;
  outcome.conversion_type          = type;
  outcome.event_timestamp_ms       = at_ms;
  outcome.session_id               = session;
  outcome.session_duration_seconds = 120.0;

  auto tx = repo.Begin();
  assert(repo.InsertOutcome(*tx, outcome));
  tx->Commit();
}

// ---------------------------------------------------------------------------
// ROAS calculator
// ---------------------------------------------------------------------------

void TestCalculateBlendsTowardPriorWithFewConversions() {
  World w;
  const auto scope = CampaignScope("c-1");

  InsertInsight(*w.repository, scope, kEpochMs - 2 * kDayMs, 10'000, 200, 100.0);
  for (int i = 0; i < 5; ++i) {
    InsertOutcome(*w.repository, "o-" + std::to_string(i), scope, kEpochMs - kDayMs + i * kHourMs, 60.0);
  }

  RoasCalculator calculator({}, w.repository, w.clock, 42);
  const auto     result = calculator.Calculate(scope);

  assert(Near(result.total_revenue_usd, 300.0));
  assert(Near(result.total_cost_usd, 100.0));
  assert(Near(result.actual_roas, 3.0));
  assert(result.total_conversions == 5);
  assert(result.sample_size == 5);
  assert(result.clicks == 200);
  assert(Near(result.conversion_rate, 5.0 / 200.0));

  // 5 of 30 conversions: equal weight on the 2.0 prior and the observed 3.0
  assert(Near(result.smoothed_roas, 2.5));

  // identical order values resample to the same ratio
  assert(Near(result.confidence_interval_low, 3.0));
  assert(Near(result.confidence_interval_high, 3.0));
  assert(!result.is_outlier);
}

void TestBootstrapIntervalOnVariedOrderValues() {
  World          w;
  RoasCalculator calculator({}, w.repository, w.clock, 7);

  const std::vector<double> values = {10.0, 25.0, 40.0, 80.0, 145.0, 300.0};
  const double              spend  = 100.0;
  const auto [low, high]           = calculator.ConfidenceInterval(values, spend);

  assert(low <= high);
  assert(low < high);
  // every resample sums six draws from [10, 300]
  assert(low >= 6 * 10.0 / spend);
  assert(high <= 6 * 300.0 / spend);
  assert(low <= 6.0 && 6.0 <= high);

  // the same bounds hold when the interval comes out of Calculate
  const auto scope = CampaignScope("c-varied");
  InsertInsight(*w.repository, scope, kEpochMs - 2 * kDayMs, 8'000, 160, spend);
  for (size_t i = 0; i < values.size(); ++i) {
    InsertOutcome(*w.repository, "o-v" + std::to_string(i), scope, kEpochMs - kDayMs + i * kHourMs, values[i]);
  }
  const auto result = calculator.Calculate(scope);
  assert(Near(result.actual_roas, 6.0));
  assert(result.confidence_interval_low <= result.confidence_interval_high);
  assert(result.confidence_interval_low <= result.actual_roas && result.actual_roas <= result.confidence_interval_high);
}

void TestCalculateWithoutSpendIsZero() {
  World w;
  const auto scope = CampaignScope("c-empty");
  InsertOutcome(*w.repository, "o-1", scope, kEpochMs - kHourMs, 40.0);

  RoasCalculator calculator({}, w.repository, w.clock, 1);
  const auto     result = calculator.Calculate(scope);

  assert(result.actual_roas == 0.0);
  assert(result.confidence_interval_low == 0.0 && result.confidence_interval_high == 0.0);
}

void TestCalculateRejectsInvertedWindow() {
  World          w;
  RoasCalculator calculator({}, w.repository, w.clock, 1);

  bool threw = false;
  try {
    const auto now = w.clock->Now();
    (void)calculator.Calculate(CampaignScope("c-1"), now, now - std::chrono::hours(1));
  } catch (const autopilot::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestSmoothEdges() {
  World          w;
  RoasCalculator calculator({}, w.repository, w.clock, 1);

  assert(Near(calculator.Smooth(7.0, 0), 2.0));
  assert(Near(calculator.Smooth(7.0, 30), 7.0));
  assert(Near(calculator.Smooth(7.0, 300), 7.0));
}

void TestOutlierRulesFirstMatchWins() {
  auto v = RoasCalculator::DetectOutlier(60.0, 1, 5.0);
  assert(v.is_outlier && v.reason == "Extremely high ROAS (>50x)");

  v = RoasCalculator::DetectOutlier(-1.0, 10, 100.0);
  assert(v.is_outlier && v.reason == "Negative ROAS");

  v = RoasCalculator::DetectOutlier(12.0, 10, 5.0);
  assert(v.is_outlier && v.reason == "Low spend (<$10) with high ROAS");

  v = RoasCalculator::DetectOutlier(6.0, 2, 100.0);
  assert(v.is_outlier && v.reason == "Too few conversions (2) for reliable ROAS");

  v = RoasCalculator::DetectOutlier(3.0, 10, 100.0);
  assert(!v.is_outlier && v.reason.empty());
}

// ---------------------------------------------------------------------------
// Attribution
// ---------------------------------------------------------------------------

std::vector<OutcomeRecord> Outcomes(const std::vector<uint64_t>& timestamps) {
  std::vector<OutcomeRecord> out;
  for (size_t i = 0; i < timestamps.size(); ++i) {
    OutcomeRecord o;
    o.outcome_id         = "o-" + std::to_string(i);
    o.event_timestamp_ms = timestamps[i];
    o.value_usd          = 10.0;
    out.push_back(o);
  }
  return out;
}

void TestLinearSplitsEvenly() {
  const auto out = AttributionEngine::Apply(Outcomes({1, 2, 3, 4}), "linear");
  for (const auto& o : out) {
    assert(Near(o.attribution_weight, 0.25));
    assert(o.attribution_model == "linear");
  }
}

void TestTimeDecayHalvesPerWeek() {
  const auto out = AttributionEngine::Apply(Outcomes({kEpochMs - 7 * kDayMs, kEpochMs}), "time_decay");
  assert(Near(out[0].attribution_weight, 1.0 / 3.0, 1e-9));
  assert(Near(out[1].attribution_weight, 2.0 / 3.0, 1e-9));
  assert(Near(out[0].attribution_weight + out[1].attribution_weight, 1.0));
  assert(out[0].attribution_model == "time_decay");
}

void TestTimeDecayOrdersEventsAndFavorsTheNewest() {
  // deliberately out of order: 3 days ago, now, 10 days ago, 1 day ago
  const auto out = AttributionEngine::Apply(
      Outcomes({kEpochMs - 3 * kDayMs, kEpochMs, kEpochMs - 10 * kDayMs, kEpochMs - kDayMs}), "time_decay");
  assert(out.size() == 4);

  double total = 0.0;
  for (size_t i = 0; i < out.size(); ++i) {
    total += out[i].attribution_weight;
    if (i > 0) {
      assert(out[i - 1].event_timestamp_ms <= out[i].event_timestamp_ms);
      assert(out[i - 1].attribution_weight < out[i].attribution_weight);
    }
  }
  assert(std::abs(total - 1.0) <= 1e-9);

  assert(out.back().event_timestamp_ms == kEpochMs);
  assert(out.back().outcome_id == "o-1");
  for (size_t i = 0; i + 1 < out.size(); ++i) {
    assert(out[i].attribution_weight < out.back().attribution_weight);
  }
}

void TestClickModelsWeightOne() {
  for (const auto* model : {"last_click", "first_click"}) {
    const auto out = AttributionEngine::Apply(Outcomes({1, 2, 3}), model);
    for (const auto& o : out) {
      assert(o.attribution_weight == 1.0);
      assert(o.attribution_model == model);
    }
  }
}

void TestUnknownModelLeavesOutcomesUntouched() {
  auto in                  = Outcomes({1, 2});
  in[0].attribution_weight = 0.4;
  const auto out           = AttributionEngine::Apply(in, "data_driven");
  assert(out[0].attribution_weight == 0.4);
  assert(out[0].attribution_model == "last_click");
  assert(out[1].attribution_weight == 1.0);

  assert(AttributionEngine::Apply(std::vector<OutcomeRecord>{}, "linear").empty());
}

// ---------------------------------------------------------------------------
// Prediction
// ---------------------------------------------------------------------------

void TestForecastSeedsWithOldestValue() {
  World            w;
  PredictionEngine engine({}, 2.0, w.repository, w.clock);

  std::vector<RoasMetricsRecord> history(3);
  history[0].actual_roas = 3.0; // newest
  history[1].actual_roas = 2.0;
  history[2].actual_roas = 1.0;

  const auto forecast = engine.Forecast(history);
  assert(Near(forecast.predicted_roas, 1.81));
  assert(Near(forecast.confidence, 0.1));
  assert(forecast.historical_points == 3);
  assert(forecast.trend == "increasing");

  std::swap(history[0], history[2]);
  assert(engine.Forecast(history).trend == "decreasing");
}

void TestForecastWithoutHistoryFallsBackToPrior() {
  World            w;
  PredictionEngine engine({}, 2.0, w.repository, w.clock);

  const auto forecast = engine.PredictRoas(CampaignScope("nothing-recorded"));
  assert(forecast.predicted_roas == 2.0);
  assert(forecast.confidence == 0.0);
  assert(forecast.historical_points == 0);
  assert(forecast.trend.empty());
}

void TestPredictRoasReadsRecordedDays() {
  World w;
  for (int day = 1; day <= 4; ++day) {
    autopilot::testing::MetricsRow row;
    row.roas = 2.0;
    autopilot::testing::SeedMetrics(*w.repository, "c-1", "ad-1", w.clock->Now() - std::chrono::hours(24 * day), row);
  }

  PredictionEngine engine({}, 1.0, w.repository, w.clock);
  const auto       forecast = engine.PredictRoas(CampaignScope("c-1"), 7);
  assert(forecast.historical_points == 4);
  assert(Near(forecast.predicted_roas, 2.0));
}

void TestConversionProbabilityPosterior() {
  const auto p = PredictionEngine::CalculateConversionProbability(100, 10);
  assert(Near(p.probability, 11.0 / 102.0));
  assert(p.ci_low > 0.0 && p.ci_low < p.probability);
  assert(p.ci_high > p.probability && p.ci_high < 1.0);

  const auto none = PredictionEngine::CalculateConversionProbability(0, 0);
  assert(none.probability == 0.0 && none.ci_low == 0.0 && none.ci_high == 0.0);

  bool threw = false;
  try {
    (void)PredictionEngine::CalculateConversionProbability(5, 6);
  } catch (const autopilot::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestExpectedValue() {
  const auto ev = PredictionEngine::CalculateExpectedValue(0.05, 100.0, 2.0);
  assert(Near(ev.expected_revenue, 5.0));
  assert(Near(ev.expected_value, 3.0));
  assert(Near(ev.expected_cost, 2.0));
  assert(Near(ev.breakeven_rate, 0.02));
  assert(ev.is_profitable);

  const auto loss = PredictionEngine::CalculateExpectedValue(0.01, 100.0, 2.0);
  assert(!loss.is_profitable);
  assert(PredictionEngine::CalculateExpectedValue(0.1, 0.0, 1.0).breakeven_rate == 0.0);
}

// ---------------------------------------------------------------------------
// Budget allocator
// ---------------------------------------------------------------------------

RoasMetricsRecord Row(const std::string& ad, double roas, double confidence, uint64_t sample = 50, bool outlier = false) {
  RoasMetricsRecord r;
  r.scope.ad_id      = ad;
  r.actual_roas      = roas;
  r.confidence_score = confidence;
  r.sample_size      = sample;
  r.is_outlier       = outlier;
  return r;
}

void TestReallocationWeightsByRoasAndConfidence() {
  BudgetAllocator allocator({}, 30);

  const auto plan = allocator.ComputeReallocations(
      {Row("ad-b", 1.2, 0.8), Row("ad-a", 3.0, 0.9), Row("ad-c", 0.5, 0.9), Row("ad-d", 4.0, 0.9, 50, true), Row("ad-e", 3.0, 0.5)}, 318.0);

  assert(plan.allocations_size() == 3);
  assert(plan.allocations(0).ad_id() == "ad-a");
  assert(Near(plan.allocations(0).allocated_budget(), 270.0, 1e-6));
  assert(plan.allocations(1).ad_id() == "ad-b");
  assert(Near(plan.allocations(1).allocated_budget(), 48.0, 1e-6));
  assert(plan.allocations(2).ad_id() == "ad-c");
  assert(plan.allocations(2).allocated_budget() == 0.0);
  assert(Near(plan.total_allocated(), 318.0, 1e-6));
  assert(Near(plan.unallocated(), 0.0, 1e-6));
}

void TestReallocationWithNothingEligibleAllocatesNothing() {
  BudgetAllocator allocator({}, 30);
  const auto      plan = allocator.ComputeReallocations({Row("ad-x", 0.3, 0.9)}, 100.0);
  assert(plan.allocations_size() == 1);
  assert(plan.total_allocated() == 0.0);
  assert(plan.unallocated() == 100.0);
}

void TestWinnersAndLosersAroundMedian() {
  BudgetAllocator allocator({}, 30);

  const auto wl = allocator.DetectWinnersLosers(
      {Row("a", 4.0, 0.9), Row("b", 2.0, 0.9), Row("c", 2.0, 0.9), Row("d", 1.0, 0.9), Row("e", 0.9, 0.9), Row("small", 9.0, 0.9, 10)});

  assert(wl.total_analyzed == 5);
  assert(wl.median_roas == 2.0);
  assert(wl.winners.size() == 1 && wl.winners[0].scope.ad_id == "a");
  assert(wl.losers.size() == 2);
  assert(wl.losers[0].scope.ad_id == "d");
  assert(wl.losers[1].scope.ad_id == "e");
}

// ---------------------------------------------------------------------------
// Metrics recorder
// ---------------------------------------------------------------------------

void TestTiersAndRecommendations() {
  assert(MetricsRecorder::PerformanceTier(5.5, 0.06) == "excellent");
  assert(MetricsRecorder::PerformanceTier(3.5, 0.035) == "good");
  assert(MetricsRecorder::PerformanceTier(2.5, 0.025) == "average");
  assert(MetricsRecorder::PerformanceTier(1.5, 0.015) == "poor");
  assert(MetricsRecorder::PerformanceTier(6.0, 0.001) == "failing");

  assert(MetricsRecorder::Recommend("excellent", 5.0, 5.0).action == "scale_up");
  assert(MetricsRecorder::Recommend("excellent", 5.0, 5.0).budget_change_pct == 50.0);
  assert(MetricsRecorder::Recommend("good", 3.0, 3.2).budget_change_pct == 25.0);
  assert(MetricsRecorder::Recommend("good", 3.0, 2.8).action == "monitor");
  assert(MetricsRecorder::Recommend("average", 2.0, 2.0).action == "test");
  assert(MetricsRecorder::Recommend("poor", 1.0, 1.0).budget_change_pct == -30.0);
  assert(MetricsRecorder::Recommend("failing", 0.2, 0.2).action == "pause");
}

void TestSessionSignals() {
  std::vector<OutcomeRecord> outcomes(3);
  outcomes[0].conversion_type          = "purchase";
  outcomes[0].session_duration_seconds = 300.0;
  outcomes[0].value_usd                = 50.0;
  outcomes[0].session_id               = "s-1";
  outcomes[1].conversion_type          = "page_view";
  outcomes[1].session_duration_seconds = 150.0;
  outcomes[1].session_id               = "s-1";
  outcomes[2].conversion_type          = "purchase";
  outcomes[2].value_usd                = 150.0;
  outcomes[2].session_id               = "s-1";

  // durations 300 + 150 + 0 -> 150 avg -> 50; 2 of 3 high value
  assert(Near(MetricsRecorder::SessionQualityScore(outcomes), 56.67));
  assert(Near(MetricsRecorder::RetentionProbability(outcomes), 1.0));
  assert(Near(MetricsRecorder::LifetimeValueEstimate(outcomes), 500.0));

  assert(MetricsRecorder::SessionQualityScore({}) == 0.0);
  assert(MetricsRecorder::RetentionProbability({}) == 0.0);
  assert(MetricsRecorder::LifetimeValueEstimate({}) == 0.0);
}

void TestRecordDailyMetricsWritesOncePerDay() {
  World      w;
  const auto scope = CampaignScope("c-rec");
  const auto day   = autopilot::util::ToUnixMillis(autopilot::util::StartOfDay(w.clock->Now())) - kDayMs;

  InsertInsight(*w.repository, scope, day + kHourMs, 4'000, 100, 50.0);
  for (int i = 0; i < 4; ++i) {
    InsertOutcome(*w.repository, "r-" + std::to_string(i), scope, day + 2 * kHourMs + i, 25.0);
  }

  auto calculator = std::make_shared<RoasCalculator>(autopilot::config::RoasSettings{}, w.repository, w.clock, 3);
  auto prediction = std::make_shared<PredictionEngine>(autopilot::config::PredictionSettings{}, 2.0, w.repository, w.clock);
  MetricsRecorder recorder(w.repository, calculator, prediction, w.clock);

  const auto row = recorder.RecordDailyMetrics(scope, autopilot::util::FromUnixMillis(day + 5 * kHourMs));
  assert(row.date_ms == day);
  assert(Near(row.actual_roas, 2.0));
  assert(row.conversions == 4);
  assert(row.clicks == 100);
  assert(Near(row.blended_ctr, 2.5));
  assert(Near(row.blended_cpc, 0.5));
  assert(Near(row.blended_cpm, 12.5));
  assert(row.performance_tier == "average");
  assert(row.recommendation == "test");
  assert(row.conversion_probability > 0.0);

  bool threw = false;
  try {
    (void)recorder.RecordDailyMetrics(scope, autopilot::util::FromUnixMillis(day));
  } catch (const autopilot::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCalculateBlendsTowardPriorWithFewConversions();
  TestBootstrapIntervalOnVariedOrderValues();
  TestCalculateWithoutSpendIsZero();
  TestCalculateRejectsInvertedWindow();
  TestSmoothEdges();
  TestOutlierRulesFirstMatchWins();

  TestLinearSplitsEvenly();
  TestTimeDecayHalvesPerWeek();
  TestTimeDecayOrdersEventsAndFavorsTheNewest();
  TestClickModelsWeightOne();
  TestUnknownModelLeavesOutcomesUntouched();

  TestForecastSeedsWithOldestValue();
  TestForecastWithoutHistoryFallsBackToPrior();
  TestPredictRoasReadsRecordedDays();
  TestConversionProbabilityPosterior();
  TestExpectedValue();

  TestReallocationWeightsByRoasAndConfidence();
  TestReallocationWithNothingEligibleAllocatesNothing();
  TestWinnersAndLosersAroundMedian();

  TestTiersAndRecommendations();
  TestSessionSignals();
  TestRecordDailyMetricsWritesOncePerDay();

  std::cout << "autopilot_unit_analytics: pass\n";
  return 0;
}
