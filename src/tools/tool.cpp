#include "execbox/tools/tool.hpp"

#include "execbox/common/json_util.hpp"

namespace execbox::tools {

std::string_view tool_category_to_string(const ToolCategory category) {
  switch (category) {
  case ToolCategory::Development:
    return "development";
  case ToolCategory::System:
    return "system";
  case ToolCategory::Analysis:
    return "analysis";
  }
  return "development";
}

std::string_view execution_mode_to_string(const ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::Direct:
    return "direct";
  case ExecutionMode::Restricted:
    return "restricted";
  case ExecutionMode::Sandboxed:
    return "sandboxed";
  }
  return "direct";
}

ExecutionResult ExecutionResult::succeeded(std::string result) {
  ExecutionResult out;
  out.success = true;
  out.result = std::move(result);
  return out;
}

ExecutionResult ExecutionResult::failed(const common::ErrorKind kind, std::string error) {
  ExecutionResult out;
  out.success = false;
  out.error = std::move(error);
  out.metadata["error_type"] = std::string(common::error_kind_to_string(kind));
  return out;
}

std::string ExecutionResult::to_json() const {
  std::string json = "{\"success\":";
  json += success ? "true" : "false";
  json += ",\"result\":\"" + common::json_escape(result) + "\"";
  json += ",\"error\":\"" + common::json_escape(error) + "\"";
  json += ",\"truncated\":";
  json += truncated ? "true" : "false";
  json += ",\"metadata\":" + common::json_object(metadata);
  json += "}";
  return json;
}

common::Result<ExecutionResult> ExecutionResult::from_json(const std::string &json) {
  if (!common::json_is_object(json) || !common::json_member(json, "success")) {
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Validation,
                                                    "not an execution result document");
  }

  ExecutionResult out;
  out.success = common::json_get_bool(json, "success", false);
  out.result = common::json_get_string(json, "result");
  out.error = common::json_get_string(json, "error");
  out.truncated = common::json_get_bool(json, "truncated", false);
  for (auto &[key, value] : common::json_parse_flat(common::json_get_object(json, "metadata"))) {
    out.metadata[key] = value;
  }
  return common::Result<ExecutionResult>::success(std::move(out));
}

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || it->second.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

} // namespace execbox::tools
