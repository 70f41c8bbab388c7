#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace autopilot::service {

// Span + request metrics around one RPC body. Exceptions are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  autopilot::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    autopilot::observability::Metrics::Instance().RecordRequest(route, success);
    autopilot::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AUTOPILOT_LOG_ERROR("RPC failed", {autopilot::observability::StringField("route", route),
                                       autopilot::observability::StringField("error", ex.what()),
                                       autopilot::observability::StringField(subject_key, subject)});
    finish(false);
    throw;
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  return ObserveRpc(route, "subject", "", std::forward<Fn>(fn));
}

} // namespace autopilot::service
