#pragma once

#include "pathfence/config/schema.hpp"
#include "pathfence/observability/observer.hpp"

#include <memory>

namespace pathfence::observability {

[[nodiscard]] bool is_known_backend(const std::string &backend);
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace pathfence::observability
