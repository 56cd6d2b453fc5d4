#include "sidecar/observability/multi_observer.hpp"

namespace sidecar::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> backends)
    : backends_(std::move(backends)) {
  std::erase_if(backends_, [](const auto &backend) { return backend == nullptr; });
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &backend : backends_) {
    backend->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &backend : backends_) {
    backend->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &backend : backends_) {
    backend->flush();
  }
}

} // namespace sidecar::observability
