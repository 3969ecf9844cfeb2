#include "pathfence/observability/global.hpp"

#include <mutex>
#include <utility>

namespace pathfence::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::exchange(g_observer, std::shared_ptr<IObserver>(std::move(observer)));
  }
  // Destroyed here, or by the last in-flight dispatch still holding it.
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_path_resolved(const std::string &user_path, const std::filesystem::path &resolved) {
  record_event(PathResolvedEvent{.user_path = user_path, .resolved = resolved});
}

void record_path_rejected(const std::string &user_path, const std::string_view kind,
                          const std::string &message) {
  record_event(
      PathRejectedEvent{.user_path = user_path, .kind = std::string(kind), .message = message});
}

void record_config_loaded(const std::filesystem::path &path) {
  record_event(ConfigLoadedEvent{.path = path});
}

void record_resolve_latency(const std::chrono::microseconds latency) {
  record_metric(ResolveLatencyMetric{.latency = latency});
}

void record_check_batch(const std::uint64_t total, const std::uint64_t rejected) {
  record_metric(CheckBatchMetric{.total = total, .rejected = rejected});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace pathfence::observability
