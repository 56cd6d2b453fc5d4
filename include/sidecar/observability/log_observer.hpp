#pragma once

#include "sidecar/observability/observer.hpp"

namespace sidecar::observability {

/// Writes one "[LEVEL] key=value" line per event or metric to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace sidecar::observability
