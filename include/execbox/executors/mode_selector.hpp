#pragma once

#include "execbox/tools/tool.hpp"

#include <string>

namespace execbox::executors {

struct ModeDecision {
  tools::ExecutionMode mode = tools::ExecutionMode::Direct;
  // Isolation was wanted but the container runtime is missing.
  bool degraded = false;
  std::string reason;
};

/// Pure: the same three inputs always produce the same decision.
[[nodiscard]] ModeDecision select_execution_mode(const tools::ToolDescriptor &descriptor,
                                                 bool force_sandbox, bool runtime_available);

} // namespace execbox::executors
