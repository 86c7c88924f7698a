#include "execbox/tools/tool_registry.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/tools/builtin/code_execution.hpp"
#include "execbox/tools/builtin/system_command.hpp"
#include "execbox/tools/builtin/text_statistics.hpp"

namespace execbox::tools {

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool) {
  const std::string key = common::to_lower(std::string(tool->name()));
  if (const auto existing = by_name_.find(key); existing != by_name_.end()) {
    std::erase(tools_, existing->second);
  }
  by_name_[key] = tool;
  tools_.push_back(std::move(tool));
}

std::shared_ptr<ITool> ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<ToolDescriptor> ToolRegistry::descriptors() const {
  std::vector<ToolDescriptor> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool->descriptor());
  }
  return out;
}

ToolRegistry ToolRegistry::create_default(
    const config::Config &config, std::shared_ptr<executors::RestrictedExecutor> restricted,
    std::shared_ptr<executors::SubprocessExecutor> subprocess) {
  ToolRegistry registry;
  registry.register_tool(
      std::make_unique<CodeExecutionTool>(config.code_execution, std::move(restricted), subprocess));
  registry.register_tool(std::make_unique<SystemCommandTool>(
      std::move(subprocess), std::chrono::seconds(config.execution.tool_timeout_seconds)));
  registry.register_tool(std::make_unique<TextStatisticsTool>());
  return registry;
}

} // namespace execbox::tools
