#include "execbox/tools/builtin/text_statistics.hpp"

#include <cctype>

namespace execbox::tools {

TextStatistics compute_text_statistics(const std::string &text) {
  TextStatistics stats;
  bool in_word = false;
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((byte & 0xC0U) != 0x80U) {
      ++stats.characters;
    }
    if (ch == '\n') {
      ++stats.lines;
    }
    if (std::isspace(byte) != 0) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++stats.words;
    }
  }
  if (!text.empty() && text.back() != '\n') {
    ++stats.lines;
  }
  return stats;
}

TextStatisticsTool::TextStatisticsTool()
    : descriptor_{.name = "text_statistics",
                  .description = "Count lines, words and characters of a text",
                  .category = ToolCategory::Analysis,
                  .is_safe = true,
                  .requires_sandbox = false} {}

common::Result<ExecutionResult> TextStatisticsTool::execute(const ToolArgs &args,
                                                            const ToolContext &) {
  const auto it = args.find("text");
  if (it == args.end()) {
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Validation,
                                                    "Missing argument: text");
  }

  const auto stats = compute_text_statistics(it->second);
  auto result = ExecutionResult::succeeded(
      "{\"lines\":" + std::to_string(stats.lines) + ",\"words\":" + std::to_string(stats.words) +
      ",\"characters\":" + std::to_string(stats.characters) + "}");
  result.metadata["output_length"] = std::to_string(result.result.size());
  return common::Result<ExecutionResult>::success(std::move(result));
}

} // namespace execbox::tools
