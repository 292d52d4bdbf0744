#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace roster::runtime::config {
class RuntimeConfig;
}

namespace roster::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings resolved from the observability config block.
struct OtlpConfig {
  std::string   service_name{"roster-ledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const roster::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const roster::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// RAII span. Without ROSTER_ENABLE_OTEL every member is an inline no-op.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void RecordException(std::string_view description);

 private:
#ifdef ROSTER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordMoveOutcome(std::string_view status);
  void RecordClaimOutcome(std::string_view status);
  void ObserveClaimBatchDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ROSTER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ROSTER_ENABLE_OTEL
inline bool InitializeTracing(const roster::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const roster::runtime::config::RuntimeConfig&) {
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

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordMoveOutcome(std::string_view) {
}

inline void Metrics::RecordClaimOutcome(std::string_view) {
}

inline void Metrics::ObserveClaimBatchDurationMs(double) {
}
#endif

} // namespace roster::observability
