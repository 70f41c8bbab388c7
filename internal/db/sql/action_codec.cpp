#include "action_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace autopilot::db::sql {

namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("corrupt " + message.GetTypeName() + " column: " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::string EncodeExecutionResult(const std::optional<autopilot::v1::ExecutionResult>& result) {
  return result ? ToJson(*result) : std::string();
}

std::optional<autopilot::v1::ExecutionResult> DecodeExecutionResult(const std::string& json) {
  if (json.empty()) return std::nullopt;
  return FromJson<autopilot::v1::ExecutionResult>(json);
}

std::string EncodeReallocationPlan(const std::optional<autopilot::v1::ReallocationPlan>& plan) {
  return plan ? ToJson(*plan) : std::string();
}

std::optional<autopilot::v1::ReallocationPlan> DecodeReallocationPlan(const std::string& json) {
  if (json.empty()) return std::nullopt;
  return FromJson<autopilot::v1::ReallocationPlan>(json);
}

std::string EncodeIdList(const std::vector<std::string>& ids) {
  google::protobuf::ListValue list;
  for (const auto& id : ids) {
    list.add_values()->set_string_value(id);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeIdList(const std::string& json) {
  std::vector<std::string> ids;
  if (json.empty()) return ids;

  const auto list = FromJson<google::protobuf::ListValue>(json);
  ids.reserve(list.values_size());
  for (const auto& value : list.values()) {
    ids.push_back(value.string_value());
  }
  return ids;
}

} // namespace autopilot::db::sql
