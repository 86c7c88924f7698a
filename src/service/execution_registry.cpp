#include "execbox/service/execution_registry.hpp"

#include <algorithm>

namespace execbox::service {

bool ExecutionRegistry::insert(ActiveExecution entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = entry.execution_id;
  return entries_.emplace(key, std::move(entry)).second;
}

std::optional<ActiveExecution> ExecutionRegistry::erase(const std::string &execution_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(execution_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  ActiveExecution out = std::move(it->second);
  entries_.erase(it);
  return out;
}

std::optional<ActiveExecution> ExecutionRegistry::find(const std::string &execution_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(execution_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ActiveExecution> ExecutionRegistry::snapshot() const {
  std::vector<ActiveExecution> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(entries_.size());
    for (const auto &[id, entry] : entries_) {
      out.push_back(entry);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const ActiveExecution &a, const ActiveExecution &b) { return a.started < b.started; });
  return out;
}

std::size_t ExecutionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace execbox::service
