#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sidecar::observability {

struct ExtractionStartEvent {
  std::string session_id;
  std::string project_path;
  bool snapshot = false;
};

struct ExtractionEndEvent {
  std::string session_id;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct StageEvent {
  std::string stage;
  std::string detail;
};

struct LockEvent {
  std::string session_id;
  std::string action;
};

struct SpawnEvent {
  std::string session_id;
  bool snapshot = false;
  bool success = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ExtractionStartEvent, ExtractionEndEvent, StageEvent,
                                   LockEvent, SpawnEvent, WarningEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensEstimatedMetric {
  std::uint64_t tokens = 0;
};

struct FilteredMessagesMetric {
  std::uint64_t original = 0;
  std::uint64_t kept = 0;
};

struct ChangeSetSizeMetric {
  std::uint64_t files = 0;
  std::uint64_t additions = 0;
  std::uint64_t deletions = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokensEstimatedMetric,
                                    FilteredMessagesMetric, ChangeSetSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sidecar::observability
