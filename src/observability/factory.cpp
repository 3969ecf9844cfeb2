#include "pathfence/observability/factory.hpp"

#include "pathfence/common/fs.hpp"
#include "pathfence/observability/log_observer.hpp"
#include "pathfence/observability/multi_observer.hpp"
#include "pathfence/observability/noop_observer.hpp"

#include <sstream>

namespace pathfence::observability {

namespace {

bool is_single_backend(const std::string &name) {
  return name == "log" || name == "none" || name == "noop";
}

} // namespace

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty()) {
    return true;
  }

  std::stringstream stream(normalized);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (!is_single_backend(common::trim(part))) {
      return false;
    }
  }
  return true;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>());
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>();
}

} // namespace pathfence::observability
