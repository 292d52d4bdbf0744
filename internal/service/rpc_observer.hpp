#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace roster::service {

// Runs one RPC body inside a span, records request metrics, and logs then
// rethrows failures for the gRPC layer to translate.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) -> decltype(fn()) {
  roster::observability::SpanScope span(route);
  const auto                       started_at = std::chrono::steady_clock::now();
  auto&                            metrics    = roster::observability::Metrics::Instance();

  const auto elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = std::forward<Fn>(fn)();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ROSTER_LOG_ERROR("RPC failed", {roster::observability::StringField("route", route), roster::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace roster::service
