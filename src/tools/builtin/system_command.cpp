#include "execbox/tools/builtin/system_command.hpp"

namespace execbox::tools {

SystemCommandTool::SystemCommandTool(std::shared_ptr<executors::SubprocessExecutor> subprocess,
                                     const std::chrono::seconds timeout)
    : descriptor_{.name = "system_command",
                  .description = "Run a shell command and return its output",
                  .category = ToolCategory::System,
                  .is_safe = false,
                  .requires_sandbox = false},
      subprocess_(std::move(subprocess)), timeout_(timeout) {}

common::Result<ExecutionResult> SystemCommandTool::execute(const ToolArgs &args,
                                                           const ToolContext &ctx) {
  auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ExecutionResult>::failure(command.kind(), command.error());
  }
  if (!subprocess_ || !subprocess_->is_available("shell")) {
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Runtime,
                                                    "shell interpreter unavailable");
  }

  auto result = subprocess_->execute("shell", command.value(), timeout_, ctx.scratch_dir);
  result.metadata["command"] = command.value();
  return common::Result<ExecutionResult>::success(std::move(result));
}

} // namespace execbox::tools
