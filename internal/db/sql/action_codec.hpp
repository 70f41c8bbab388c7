#pragma once

#include <optional>
#include <string>
#include <vector>

#include "autopilot/v1/types.pb.h"

namespace autopilot::db::sql {

/*
  JSON column codecs shared by the SQL backends.

  Encode of an empty optional yields "" which the backends store as NULL.
  Decode throws std::runtime_error on malformed JSON (treated as corruption).
*/

std::string                                   EncodeExecutionResult(const std::optional<autopilot::v1::ExecutionResult>& result);
std::optional<autopilot::v1::ExecutionResult> DecodeExecutionResult(const std::string& json);

std::string                                    EncodeReallocationPlan(const std::optional<autopilot::v1::ReallocationPlan>& plan);
std::optional<autopilot::v1::ReallocationPlan> DecodeReallocationPlan(const std::string& json);

std::string              EncodeIdList(const std::vector<std::string>& ids);
std::vector<std::string> DecodeIdList(const std::string& json);

} // namespace autopilot::db::sql
