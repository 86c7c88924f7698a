#pragma once

#include "execbox/config/schema.hpp"
#include "execbox/executors/restricted_executor.hpp"
#include "execbox/executors/subprocess_executor.hpp"
#include "execbox/tools/tool.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace execbox::tools {

/// Name to tool lookup. Names are matched case-insensitively; registering a name twice
/// replaces the earlier tool. Tools are shared so a call abandoned past its deadline keeps
/// its tool alive after the registry is gone.
class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::shared_ptr<ITool> tool);
  [[nodiscard]] std::shared_ptr<ITool> get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolDescriptor> descriptors() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

  /// code_execution, system_command and text_statistics wired to the given executors.
  [[nodiscard]] static ToolRegistry
  create_default(const config::Config &config,
                 std::shared_ptr<executors::RestrictedExecutor> restricted,
                 std::shared_ptr<executors::SubprocessExecutor> subprocess);

private:
  std::vector<std::shared_ptr<ITool>> tools_;
  std::unordered_map<std::string, std::shared_ptr<ITool>> by_name_;
};

} // namespace execbox::tools
