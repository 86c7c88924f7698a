#include "execbox/observability/global.hpp"

#include <mutex>

namespace execbox::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_execution_start(const std::string &execution_id, const std::string &tool,
                            const std::string &mode) {
  record_event(ExecutionStartEvent{.execution_id = execution_id, .tool = tool, .mode = mode});
}

void record_execution_end(const std::string &execution_id, const std::string &tool,
                          const std::string &mode, const std::chrono::milliseconds duration,
                          const bool success) {
  record_event(ExecutionEndEvent{.execution_id = execution_id,
                                 .tool = tool,
                                 .mode = mode,
                                 .duration = duration,
                                 .success = success});
  record_metric(ExecutionLatencyMetric{.mode = mode, .latency = duration});
}

void record_sandbox(const std::string &container, const std::string &action, const bool success,
                    const std::string &detail) {
  record_event(SandboxLifecycleEvent{
      .container = container, .action = action, .success = success, .detail = detail});
}

void record_runtime_check(const std::string &runtime, const bool available,
                          const std::string &detail) {
  record_event(RuntimeCheckEvent{.runtime = runtime, .available = available, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace execbox::observability
