#include "pathfence/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace pathfence::observability {

namespace {

std::mutex g_log_mutex;

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PathResolvedEvent>) {
          log_line(*out_, "DEBUG",
                   "path.resolved input='" + evt.user_path + "' resolved=" + evt.resolved.string());
        } else if constexpr (std::is_same_v<T, PathRejectedEvent>) {
          log_line(*out_, "WARN",
                   "path.rejected kind=" + evt.kind + " input='" + evt.user_path + "'");
        } else if constexpr (std::is_same_v<T, ConfigLoadedEvent>) {
          log_line(*out_, "DEBUG", "config.loaded path=" + evt.path.string());
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ResolveLatencyMetric>) {
          log_line(*out_, "DEBUG", "metric.resolve_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CheckBatchMetric>) {
          log_line(*out_, "DEBUG", "metric.check_batch total=" + std::to_string(m.total) +
                                       " rejected=" + std::to_string(m.rejected));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_->flush();
}

} // namespace pathfence::observability
