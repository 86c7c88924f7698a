#pragma once

#include "execbox/tools/tool.hpp"

#include <cstddef>

namespace execbox::tools {

struct TextStatistics {
  std::size_t lines = 0;
  std::size_t words = 0;
  std::size_t characters = 0;
};

/// Characters are UTF-8 code points. A trailing newline does not start another line.
[[nodiscard]] TextStatistics compute_text_statistics(const std::string &text);

class TextStatisticsTool final : public ITool {
public:
  TextStatisticsTool();

  [[nodiscard]] const ToolDescriptor &descriptor() const override { return descriptor_; }
  [[nodiscard]] common::Result<ExecutionResult> execute(const ToolArgs &args,
                                                        const ToolContext &ctx) override;

private:
  ToolDescriptor descriptor_;
};

} // namespace execbox::tools
