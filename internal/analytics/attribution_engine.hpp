#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/outcome_record.hpp"

namespace autopilot::analytics {

enum class AttributionModel {
  kLastClick,
  kFirstClick,
  kLinear,
  kTimeDecay,
};

std::optional<AttributionModel> ParseAttributionModel(std::string_view name);
std::string_view                ToString(AttributionModel model);

/*
  Rewrites attribution_weight / attribution_model on each outcome.

    last_click, first_click : 1.0 each (touchpoint choice happens upstream)
    linear                  : 1/N each
    time_decay              : exp(-ln2/7 * days_before_latest), normalized to sum 1;
                              outcomes are reordered oldest first

  An unrecognized model name leaves the outcomes untouched.
*/
class AttributionEngine {
 public:
  static constexpr double kHalfLifeDays = 7.0;

  static std::vector<db::model::OutcomeRecord> Apply(std::vector<db::model::OutcomeRecord> outcomes, std::string_view model);
  static void Apply(std::vector<db::model::OutcomeRecord>& outcomes, AttributionModel model);
};

} // namespace autopilot::analytics
