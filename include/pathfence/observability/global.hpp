#pragma once

#include "pathfence/observability/observer.hpp"

#include <memory>

namespace pathfence::observability {

// Replacing the observer is safe while other threads record: each dispatch holds its own
// reference, so the old observer lives until the last in-flight call returns.
void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_path_resolved(const std::string &user_path, const std::filesystem::path &resolved);
void record_path_rejected(const std::string &user_path, std::string_view kind,
                          const std::string &message);
void record_config_loaded(const std::filesystem::path &path);
void record_resolve_latency(std::chrono::microseconds latency);
void record_check_batch(std::uint64_t total, std::uint64_t rejected);
void record_error(const std::string &component, const std::string &message);

} // namespace pathfence::observability
