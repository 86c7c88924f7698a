#include "execbox/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace execbox::observability {

namespace {

std::mutex g_log_mutex;

void log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string flag(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ExecutionStartEvent>) {
          log_line("INFO", "execution.start id=" + evt.execution_id + " tool=" + evt.tool +
                               " mode=" + evt.mode);
        } else if constexpr (std::is_same_v<T, ExecutionEndEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "execution.end id=" + evt.execution_id + " tool=" + evt.tool +
                       " mode=" + evt.mode + " duration_ms=" +
                       std::to_string(evt.duration.count()) + " success=" + flag(evt.success));
        } else if constexpr (std::is_same_v<T, SandboxLifecycleEvent>) {
          std::string line = "sandbox." + evt.action + " container=" + evt.container +
                             " success=" + flag(evt.success);
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(evt.success ? "DEBUG" : "WARN", line);
        } else if constexpr (std::is_same_v<T, RuntimeCheckEvent>) {
          std::string line = "runtime.check name=" + evt.runtime + " available=" + flag(evt.available);
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line("INFO", line);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line("DEBUG", "metric.execution_latency_ms=" + std::to_string(m.latency.count()) +
                                " mode=" + m.mode);
        } else if constexpr (std::is_same_v<T, ActiveExecutionsMetric>) {
          log_line("DEBUG", "metric.active_executions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr.flush();
}

} // namespace execbox::observability
