#pragma once

#include "execbox/observability/observer.hpp"

#include <memory>

namespace execbox::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_execution_start(const std::string &execution_id, const std::string &tool,
                            const std::string &mode);
void record_execution_end(const std::string &execution_id, const std::string &tool,
                          const std::string &mode, std::chrono::milliseconds duration,
                          bool success);
void record_sandbox(const std::string &container, const std::string &action, bool success,
                    const std::string &detail = "");
void record_runtime_check(const std::string &runtime, bool available,
                          const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace execbox::observability
