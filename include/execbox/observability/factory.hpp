#pragma once

#include "execbox/observability/observer.hpp"

#include <memory>
#include <string>

namespace execbox::observability {

/// "log" selects the stderr logger; "none" and "noop" discard everything.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);

} // namespace execbox::observability
