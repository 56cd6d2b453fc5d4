#include "sidecar/observability/global.hpp"

#include <mutex>

namespace sidecar::observability {

namespace {

struct Registry {
  std::mutex mutex;
  std::unique_ptr<IObserver> observer;
};

Registry &registry() {
  static Registry instance;
  return instance;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.observer = std::move(observer);
}

IObserver *get_global_observer() {
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.observer.get();
}

void record_event(const ObserverEvent &event) {
  if (IObserver *target = get_global_observer()) {
    target->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (IObserver *target = get_global_observer()) {
    target->record_metric(metric);
  }
}

void record_stage(const std::string &stage, const std::string &detail) {
  record_event(StageEvent{.stage = stage, .detail = detail});
}

void record_lock(const std::string &session_id, const std::string &action) {
  record_event(LockEvent{.session_id = session_id, .action = action});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sidecar::observability
