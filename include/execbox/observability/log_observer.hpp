#pragma once

#include "execbox/observability/observer.hpp"

namespace execbox::observability {

/// Writes one `[LEVEL] key=value ...` line per event to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace execbox::observability
