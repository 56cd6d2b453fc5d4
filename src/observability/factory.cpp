#include "sidecar/observability/factory.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/observability/log_observer.hpp"
#include "sidecar/observability/multi_observer.hpp"
#include "sidecar/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace sidecar::observability {

namespace {

std::vector<std::string> backend_names(const std::string &list) {
  std::vector<std::string> names;
  std::stringstream stream(list);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto name = common::to_lower(common::trim(part));
    if (!name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

// nullptr for the discarding backends. Unrecognized names log rather than go silent.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return nullptr;
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  std::vector<std::unique_ptr<IObserver>> backends;
  for (const auto &name : backend_names(config.observability.backend)) {
    if (auto backend = make_backend(name); backend != nullptr) {
      backends.push_back(std::move(backend));
    }
  }

  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return std::move(backends.front());
  }
  return std::make_unique<MultiObserver>(std::move(backends));
}

} // namespace sidecar::observability
