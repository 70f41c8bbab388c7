#pragma once

#include "autopilot/v1/types.pb.h"
#include "internal/analytics/roas_calculator.hpp"
#include "internal/db/model/action_record.hpp"
#include "internal/db/model/roas_metrics_record.hpp"
#include "internal/db/model/scope.hpp"

namespace autopilot::service {

/*
  Storage record <-> wire message conversions.
*/

db::model::Scope FromProto(const autopilot::v1::Scope& scope);
autopilot::v1::Scope ToProto(const db::model::Scope& scope);

autopilot::v1::OptimizationAction ToProto(const db::model::ActionRecord& action);
autopilot::v1::RoasMetrics        ToProto(const db::model::RoasMetricsRecord& record);
autopilot::v1::RoasResult         ToProto(const analytics::RoasResult& result);

} // namespace autopilot::service
