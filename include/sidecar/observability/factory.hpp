#pragma once

#include "sidecar/config/schema.hpp"
#include "sidecar/observability/observer.hpp"

#include <memory>

namespace sidecar::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sidecar::observability
