#include "attribution_engine.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/observability/logging.hpp"

namespace autopilot::analytics {

namespace {

constexpr double kMillisPerDay = 86'400'000.0;

void Label(std::vector<db::model::OutcomeRecord>& outcomes, AttributionModel model, double weight) {
  for (auto& outcome : outcomes) {
    outcome.attribution_weight = weight;
    outcome.attribution_model  = std::string(ToString(model));
  }
}

// Outcomes come back oldest first; weights are relative to the newest event.
void ApplyTimeDecay(std::vector<db::model::OutcomeRecord>& outcomes) {
  std::stable_sort(outcomes.begin(), outcomes.end(),
                   [](const auto& a, const auto& b) { return a.event_timestamp_ms < b.event_timestamp_ms; });

  const double decay_constant = std::log(2.0) / AttributionEngine::kHalfLifeDays;
  const auto   latest         = outcomes.back().event_timestamp_ms;

  std::vector<double> weights;
  weights.reserve(outcomes.size());
  double total = 0.0;
  for (const auto& outcome : outcomes) {
    const double days_ago = static_cast<double>(latest - outcome.event_timestamp_ms) / kMillisPerDay;
    weights.push_back(std::exp(-decay_constant * days_ago));
    total += weights.back();
  }

  for (size_t i = 0; i < outcomes.size(); ++i) {
    outcomes[i].attribution_weight = weights[i] / total;
    outcomes[i].attribution_model  = std::string(ToString(AttributionModel::kTimeDecay));
  }
}

} // namespace

std::optional<AttributionModel> ParseAttributionModel(std::string_view name) {
  if (name == "last_click") return AttributionModel::kLastClick;
  if (name == "first_click") return AttributionModel::kFirstClick;
  if (name == "linear") return AttributionModel::kLinear;
  if (name == "time_decay") return AttributionModel::kTimeDecay;
  return std::nullopt;
}

std::string_view ToString(AttributionModel model) {
  switch (model) {
    case AttributionModel::kLastClick:
      return "last_click";
    case AttributionModel::kFirstClick:
      return "first_click";
    case AttributionModel::kLinear:
      return "linear";
    case AttributionModel::kTimeDecay:
      return "time_decay";
  }
  return "unknown";
}

std::vector<db::model::OutcomeRecord> AttributionEngine::Apply(std::vector<db::model::OutcomeRecord> outcomes, std::string_view model) {
  const auto parsed = ParseAttributionModel(model);
  if (!parsed) {
    AUTOPILOT_LOG_WARN("Unknown attribution model; outcomes left unchanged",
                       {observability::StringField("model", model), observability::IntField("outcomes", static_cast<int64_t>(outcomes.size()))});
    return outcomes;
  }

  Apply(outcomes, *parsed);
  return outcomes;
}

void AttributionEngine::Apply(std::vector<db::model::OutcomeRecord>& outcomes, AttributionModel model) {
  if (outcomes.empty()) return;

  switch (model) {
    case AttributionModel::kLastClick:
    case AttributionModel::kFirstClick:
      Label(outcomes, model, 1.0);
      return;
    case AttributionModel::kLinear:
      Label(outcomes, model, 1.0 / static_cast<double>(outcomes.size()));
      return;
    case AttributionModel::kTimeDecay:
      ApplyTimeDecay(outcomes);
      return;
  }
}

} // namespace autopilot::analytics
