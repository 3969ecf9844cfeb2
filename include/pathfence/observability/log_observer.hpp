#pragma once

#include "pathfence/observability/observer.hpp"

#include <iosfwd>

namespace pathfence::observability {

/// Writes "[LEVEL] message" lines. Defaults to std::cerr.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
};

} // namespace pathfence::observability
