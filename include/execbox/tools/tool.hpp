#pragma once

#include "execbox/common/result.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace execbox::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

enum class ToolCategory { Development, System, Analysis };

[[nodiscard]] std::string_view tool_category_to_string(ToolCategory category);

enum class ExecutionMode { Direct, Restricted, Sandboxed };

[[nodiscard]] std::string_view execution_mode_to_string(ExecutionMode mode);

struct ToolDescriptor {
  std::string name;
  std::string description;
  ToolCategory category = ToolCategory::Development;
  bool is_safe = false;
  bool requires_sandbox = false;
};

struct ExecutionResult {
  bool success = false;
  std::string result;
  std::string error;
  std::map<std::string, std::string> metadata;
  bool truncated = false;

  [[nodiscard]] static ExecutionResult succeeded(std::string result);
  /// Failure carrying `metadata["error_type"]` for `kind`.
  [[nodiscard]] static ExecutionResult failed(common::ErrorKind kind, std::string error);

  [[nodiscard]] std::string to_json() const;
  [[nodiscard]] static common::Result<ExecutionResult> from_json(const std::string &json);
};

struct ToolContext {
  std::string execution_id;
  ExecutionMode mode = ExecutionMode::Direct;
  std::filesystem::path scratch_dir;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual const ToolDescriptor &descriptor() const = 0;
  [[nodiscard]] virtual common::Result<ExecutionResult> execute(const ToolArgs &args,
                                                                const ToolContext &ctx) = 0;

  [[nodiscard]] std::string_view name() const { return descriptor().name; }
};

[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);

} // namespace execbox::tools
