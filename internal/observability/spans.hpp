#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace autopilot::runtime::config {
class RuntimeConfig;
}

namespace autopilot::observability {

/*
  OpenTelemetry export for the server. Without ENABLE_OTEL every call below
  is an inline no-op so the services can open spans and record metrics
  unconditionally.

  Initialize* read the observability section: a disabled signal shuts down
  any provider installed earlier and returns false.
*/
bool InitializeTracing(const autopilot::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const autopilot::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per RPC, tick or campaign evaluation; active for the lifetime of
// the object.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveTickDurationMs(double duration_ms);

  // stage: generated | policy_blocked | safety_blocked | queued | executed | failed | expired
  void RecordActionOutcome(std::string_view stage, std::string_view action_type, std::uint64_t count = 1);
  void SetQueueDepth(std::string_view status, std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const autopilot::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const autopilot::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveTickDurationMs(double) {
}

inline void Metrics::RecordActionOutcome(std::string_view, std::string_view, std::uint64_t) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace autopilot::observability
