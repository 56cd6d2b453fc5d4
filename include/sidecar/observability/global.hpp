#pragma once

#include "sidecar/observability/observer.hpp"

#include <memory>

namespace sidecar::observability {

/// Process-wide sink installed by the composition root. Recording is a no-op until set.
void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

// Shorthands for the event kinds the pipeline emits most.
void record_stage(const std::string &stage, const std::string &detail = "");
void record_lock(const std::string &session_id, const std::string &action);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace sidecar::observability
