#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace execbox::observability {

struct ExecutionStartEvent {
  std::string execution_id;
  std::string tool;
  std::string mode;
};

struct ExecutionEndEvent {
  std::string execution_id;
  std::string tool;
  std::string mode;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct SandboxLifecycleEvent {
  std::string container;
  // create | start | kill | remove | cleanup
  std::string action;
  bool success = true;
  std::string detail;
};

struct RuntimeCheckEvent {
  std::string runtime;
  bool available = false;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ExecutionStartEvent, ExecutionEndEvent, SandboxLifecycleEvent,
                                   RuntimeCheckEvent, WarningEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::string mode;
  std::chrono::milliseconds latency{0};
};

struct ActiveExecutionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, ActiveExecutionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace execbox::observability
