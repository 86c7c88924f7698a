#include "execbox/observability/factory.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/observability/log_observer.hpp"
#include "execbox/observability/noop_observer.hpp"

namespace execbox::observability {

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty() || normalized == "none" || normalized == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace execbox::observability
