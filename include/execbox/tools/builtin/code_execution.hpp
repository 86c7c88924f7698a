#pragma once

#include "execbox/config/schema.hpp"
#include "execbox/executors/restricted_executor.hpp"
#include "execbox/executors/subprocess_executor.hpp"
#include "execbox/tools/tool.hpp"

#include <chrono>
#include <memory>

namespace execbox::tools {

inline constexpr std::string_view CODE_EXECUTION_TOOL = "code_execution";

/// Runs source code. Python prefers the in-process restricted interpreter; everything
/// else goes through an external interpreter.
class CodeExecutionTool final : public ITool {
public:
  CodeExecutionTool(config::CodeExecutionConfig config,
                    std::shared_ptr<executors::RestrictedExecutor> restricted,
                    std::shared_ptr<executors::SubprocessExecutor> subprocess);

  [[nodiscard]] const ToolDescriptor &descriptor() const override { return descriptor_; }
  [[nodiscard]] common::Result<ExecutionResult> execute(const ToolArgs &args,
                                                        const ToolContext &ctx) override;

  /// `timeout` argument in seconds, clamped to 1..60; absent means the configured default.
  [[nodiscard]] common::Result<std::chrono::seconds> parse_timeout(const ToolArgs &args) const;

private:
  ToolDescriptor descriptor_;
  config::CodeExecutionConfig config_;
  std::shared_ptr<executors::RestrictedExecutor> restricted_;
  std::shared_ptr<executors::SubprocessExecutor> subprocess_;
};

} // namespace execbox::tools
