#pragma once

#include "execbox/executors/subprocess_executor.hpp"
#include "execbox/tools/tool.hpp"

#include <chrono>
#include <memory>

namespace execbox::tools {

class SystemCommandTool final : public ITool {
public:
  SystemCommandTool(std::shared_ptr<executors::SubprocessExecutor> subprocess,
                    std::chrono::seconds timeout);

  [[nodiscard]] const ToolDescriptor &descriptor() const override { return descriptor_; }
  [[nodiscard]] common::Result<ExecutionResult> execute(const ToolArgs &args,
                                                        const ToolContext &ctx) override;

private:
  ToolDescriptor descriptor_;
  std::shared_ptr<executors::SubprocessExecutor> subprocess_;
  std::chrono::seconds timeout_;
};

} // namespace execbox::tools
