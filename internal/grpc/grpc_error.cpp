#include "grpc_error.hpp"

#include "internal/gateway/ad_platform_gateway.hpp"
#include "internal/util/errors.hpp"

namespace autopilot::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace autopilot::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const autopilot::gateway::GatewayError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace autopilot::grpc
