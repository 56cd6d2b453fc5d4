#pragma once

#include "sidecar/observability/observer.hpp"

#include <memory>
#include <vector>

namespace sidecar::observability {

/// Fans every event and metric out to each backend in order.
class MultiObserver final : public IObserver {
public:
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> backends);

  [[nodiscard]] std::size_t size() const { return backends_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
};

} // namespace sidecar::observability
