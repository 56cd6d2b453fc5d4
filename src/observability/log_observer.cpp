#include "sidecar/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sidecar::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string flag(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExtractionStartEvent>) {
          log_line("INFO", "extraction.start session=" + evt.session_id +
                               " project=" + evt.project_path + " snapshot=" + flag(evt.snapshot));
        } else if constexpr (std::is_same_v<T, ExtractionEndEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "extraction.end session=" + evt.session_id +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + flag(evt.success));
        } else if constexpr (std::is_same_v<T, StageEvent>) {
          log_line("INFO", "stage." + evt.stage + (evt.detail.empty() ? "" : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, LockEvent>) {
          log_line("DEBUG", "lock." + evt.action + " session=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, SpawnEvent>) {
          log_line(evt.success ? "INFO" : "WARN", "spawn session=" + evt.session_id +
                                                      " snapshot=" + flag(evt.snapshot) +
                                                      " success=" + flag(evt.success));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensEstimatedMetric>) {
          log_line("INFO", "metric.tokens_estimated=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, FilteredMessagesMetric>) {
          log_line("INFO", "metric.filtered_messages original=" + std::to_string(m.original) +
                               " kept=" + std::to_string(m.kept));
        } else if constexpr (std::is_same_v<T, ChangeSetSizeMetric>) {
          log_line("DEBUG", "metric.change_set files=" + std::to_string(m.files) +
                                " additions=" + std::to_string(m.additions) +
                                " deletions=" + std::to_string(m.deletions));
        }
      },
      metric);
}

void LogObserver::flush() { std::cerr.flush(); }

} // namespace sidecar::observability
