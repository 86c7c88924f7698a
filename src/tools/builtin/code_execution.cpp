#include "execbox/tools/builtin/code_execution.hpp"

#include "execbox/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace execbox::tools {

namespace {

constexpr long MIN_TIMEOUT_SECONDS = 1;
constexpr long MAX_TIMEOUT_SECONDS = 60;

std::string join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += item;
  }
  return out;
}

} // namespace

CodeExecutionTool::CodeExecutionTool(config::CodeExecutionConfig config,
                                     std::shared_ptr<executors::RestrictedExecutor> restricted,
                                     std::shared_ptr<executors::SubprocessExecutor> subprocess)
    : descriptor_{.name = std::string(CODE_EXECUTION_TOOL),
                  .description = "Execute source code in python, javascript, typescript, bash or "
                                 "shell with output capture and a timeout",
                  .category = ToolCategory::Development,
                  .is_safe = false,
                  .requires_sandbox = true},
      config_(std::move(config)), restricted_(std::move(restricted)),
      subprocess_(std::move(subprocess)) {}

common::Result<std::chrono::seconds> CodeExecutionTool::parse_timeout(const ToolArgs &args) const {
  const auto it = args.find("timeout");
  if (it == args.end() || common::trim(it->second).empty()) {
    const long fallback = std::clamp<long>(config_.default_timeout_seconds, MIN_TIMEOUT_SECONDS,
                                           MAX_TIMEOUT_SECONDS);
    return common::Result<std::chrono::seconds>::success(std::chrono::seconds(fallback));
  }

  const std::string raw = common::trim(it->second);
  double parsed = 0.0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size() || std::isnan(parsed)) {
    return common::Result<std::chrono::seconds>::failure(common::ErrorKind::Validation,
                                                         "Invalid timeout: " + raw);
  }
  const auto seconds = static_cast<long>(std::clamp(
      parsed, static_cast<double>(MIN_TIMEOUT_SECONDS), static_cast<double>(MAX_TIMEOUT_SECONDS)));
  return common::Result<std::chrono::seconds>::success(std::chrono::seconds(seconds));
}

common::Result<ExecutionResult> CodeExecutionTool::execute(const ToolArgs &args,
                                                           const ToolContext &ctx) {
  const auto code_it = args.find("code");
  if (code_it == args.end() || common::trim(code_it->second).empty()) {
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Validation,
                                                    "No code provided");
  }
  const std::string &code = code_it->second;

  std::string language = "python";
  if (const auto lang_it = args.find("language");
      lang_it != args.end() && !common::trim(lang_it->second).empty()) {
    language = common::to_lower(common::trim(lang_it->second));
  }

  auto timeout = parse_timeout(args);
  if (!timeout.ok()) {
    return common::Result<ExecutionResult>::failure(timeout.kind(), timeout.error());
  }

  const bool restricted_python = language == "python" && restricted_ && restricted_->available();
  if (restricted_python) {
    return common::Result<ExecutionResult>::success(
        restricted_->execute(code, timeout.value()));
  }

  std::vector<std::string> available;
  if (subprocess_) {
    available = subprocess_->available_languages();
  }
  if (std::find(available.begin(), available.end(), language) == available.end()) {
    return common::Result<ExecutionResult>::failure(
        common::ErrorKind::Validation,
        "Language '" + language + "' not supported. Available: " + join(available));
  }

  return common::Result<ExecutionResult>::success(
      subprocess_->execute(language, code, timeout.value(), ctx.scratch_dir));
}

} // namespace execbox::tools
