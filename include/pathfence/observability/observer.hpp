#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace pathfence::observability {

struct PathResolvedEvent {
  std::string user_path;
  std::filesystem::path resolved;
};

struct PathRejectedEvent {
  std::string user_path;
  std::string kind;
  std::string message;
};

struct ConfigLoadedEvent {
  std::filesystem::path path;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<PathResolvedEvent, PathRejectedEvent, ConfigLoadedEvent, ErrorEvent>;

struct ResolveLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct CheckBatchMetric {
  std::uint64_t total = 0;
  std::uint64_t rejected = 0;
};

using ObserverMetric = std::variant<ResolveLatencyMetric, CheckBatchMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace pathfence::observability
