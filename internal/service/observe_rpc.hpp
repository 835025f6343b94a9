#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace rollout::service {

// Span, request counter and latency histogram around one RPC body.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  rollout::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("rollout.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      rollout::observability::Metrics::Instance().RecordRequest(route, true);
      rollout::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      rollout::observability::Metrics::Instance().RecordRequest(route, true);
      rollout::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ROLLOUT_LOG_WARN("RPC failed", {rollout::observability::StringField("route", route), rollout::observability::StringField("error", ex.what()),
                                    rollout::observability::StringField("subject", subject)});
    rollout::observability::Metrics::Instance().RecordRequest(route, false);
    rollout::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace rollout::service
