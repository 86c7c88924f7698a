#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace execbox::service {

struct ActiveExecution {
  std::string execution_id;
  std::string container_id;
  std::string tool_name;
  std::chrono::system_clock::time_point started;
};

/// Execution id to container id for the sandboxed calls currently in flight. Ids are unique
/// per call, so each entry has exactly one writer; the lock only guards the map itself.
class ExecutionRegistry {
public:
  /// False when `entry.execution_id` is already present.
  bool insert(ActiveExecution entry);
  std::optional<ActiveExecution> erase(const std::string &execution_id);
  [[nodiscard]] std::optional<ActiveExecution> find(const std::string &execution_id) const;
  [[nodiscard]] std::vector<ActiveExecution> snapshot() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ActiveExecution> entries_;
};

} // namespace execbox::service
