#include "execbox/executors/mode_selector.hpp"

namespace execbox::executors {

namespace {

ModeDecision isolate(const bool runtime_available, std::string why) {
  if (runtime_available) {
    return ModeDecision{.mode = tools::ExecutionMode::Sandboxed,
                        .degraded = false,
                        .reason = std::move(why)};
  }
  return ModeDecision{.mode = tools::ExecutionMode::Restricted,
                      .degraded = true,
                      .reason = why + "; container runtime unavailable, isolation degraded"};
}

} // namespace

ModeDecision select_execution_mode(const tools::ToolDescriptor &descriptor,
                                   const bool force_sandbox, const bool runtime_available) {
  if (force_sandbox || descriptor.requires_sandbox) {
    return isolate(runtime_available, force_sandbox ? "sandbox forced by caller"
                                                    : "tool requires a sandbox");
  }
  if (!descriptor.is_safe) {
    return isolate(runtime_available, "tool is not marked safe");
  }
  return ModeDecision{.mode = tools::ExecutionMode::Direct, .degraded = false,
                      .reason = "tool is marked safe"};
}

} // namespace execbox::executors
