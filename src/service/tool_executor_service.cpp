#include "execbox/service/tool_executor_service.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/common/json_util.hpp"
#include "execbox/common/random.hpp"
#include "execbox/common/text.hpp"
#include "execbox/executors/deadline.hpp"
#include "execbox/executors/mode_selector.hpp"
#include "execbox/observability/global.hpp"
#include "execbox/sandbox/sandbox.hpp"
#include "execbox/tools/builtin/code_execution.hpp"

#include <cstdint>
#include <map>

namespace execbox::service {

namespace {

constexpr auto INSPECT_TIMEOUT = std::chrono::seconds(10);
constexpr auto KILL_TIMEOUT = std::chrono::seconds(30);
constexpr const char *JOB_DIRECTORY = "job";
constexpr const char *WRAPPER_SCRIPT = "tool_wrapper.sh";
constexpr const char *PARAMS_FILE = "params.json";

struct StagedJob {
  common::ScratchDirectory scratch;
  std::string command;
};

tools::ExecutionResult to_execution_result(common::Result<tools::ExecutionResult> result) {
  if (!result.ok()) {
    return tools::ExecutionResult::failed(result.kind(), result.error());
  }
  return std::move(result.value());
}

std::string wrapper_script(const std::string &tool_name) {
  std::string script = "#!/bin/sh\n";
  script += "if command -v execbox >/dev/null 2>&1; then\n";
  script += "  exec execbox tool " + common::shell_quote(tool_name) + " --params " +
            std::string(PARAMS_FILE) + "\n";
  script += "fi\n";
  script += "printf '%s\\n' "
            "'{\"success\":false,\"result\":\"\",\"error\":\"execbox runner not available in "
            "sandbox image\",\"metadata\":{}}'\n";
  return script;
}

// Write the entry point for `ctx` into a fresh scratch directory. Source code is written
// as-is; any other tool gets a wrapper that replays the call from params.json.
common::Result<StagedJob> stage_job(const ExecutionContext &ctx) {
  std::string file_name;
  std::string content;
  std::string command;
  std::string params_json;

  if (ctx.tool->name() == tools::CODE_EXECUTION_TOOL) {
    const auto code = ctx.parameters.find("code");
    if (code == ctx.parameters.end() || common::trim(code->second).empty()) {
      return common::Result<StagedJob>::failure(common::ErrorKind::Validation,
                                                "No code provided");
    }
    std::string language = "python";
    if (const auto it = ctx.parameters.find("language");
        it != ctx.parameters.end() && !common::trim(it->second).empty()) {
      language = common::to_lower(common::trim(it->second));
    }
    if (language == "python") {
      file_name = "execute.py";
      command = "python execute.py";
    } else if (language == "javascript") {
      file_name = "execute.js";
      command = "node execute.js";
    } else {
      return common::Result<StagedJob>::failure(common::ErrorKind::Validation,
                                                "Unsupported language for sandbox: " + language);
    }
    content = code->second;
  } else {
    file_name = WRAPPER_SCRIPT;
    content = wrapper_script(std::string(ctx.tool->name()));
    command = std::string("sh ") + WRAPPER_SCRIPT;
    params_json = common::json_object(
        std::map<std::string, std::string>(ctx.parameters.begin(), ctx.parameters.end()));
  }

  auto scratch = common::ScratchDirectory::create("sandbox_" + ctx.execution_id + "_");
  if (!scratch.ok()) {
    return common::Result<StagedJob>::failure(common::ErrorKind::Security,
                                              "Sandbox preparation failed: " + scratch.error());
  }
  StagedJob job{.scratch = std::move(scratch.value()), .command = std::move(command)};

  if (auto written = common::write_file(job.scratch.path() / file_name, content); !written.ok()) {
    return common::Result<StagedJob>::failure(common::ErrorKind::Security,
                                              "Sandbox preparation failed: " + written.error());
  }
  if (!params_json.empty()) {
    if (auto written = common::write_file(job.scratch.path() / PARAMS_FILE, params_json);
        !written.ok()) {
      return common::Result<StagedJob>::failure(common::ErrorKind::Security,
                                                "Sandbox preparation failed: " + written.error());
    }
  }
  return common::Result<StagedJob>::success(std::move(job));
}

tools::ExecutionResult classify_container_output(const ExecutionContext &ctx,
                                                 const sandbox::CommandOutput &output,
                                                 const std::size_t max_output) {
  bool truncated = false;
  tools::ExecutionResult result;
  if (output.exit_code == 0) {
    const std::string stdout_text = common::trim(output.stdout_text);
    if (ctx.tool->name() != tools::CODE_EXECUTION_TOOL) {
      if (auto parsed = tools::ExecutionResult::from_json(stdout_text); parsed.ok()) {
        result = std::move(parsed.value());
      } else {
        result = tools::ExecutionResult::succeeded(stdout_text);
      }
    } else {
      result = tools::ExecutionResult::succeeded(stdout_text);
    }
    result.result = common::truncate_output(result.result, max_output,
                                            common::OUTPUT_TRUNCATED_MARKER, &truncated);
  } else {
    std::string error = common::trim(output.stderr_text);
    if (error.empty()) {
      error = common::trim(output.stdout_text);
    }
    result = tools::ExecutionResult::failed(
        common::ErrorKind::Runtime,
        common::truncate_output(error, max_output, common::ERROR_OUTPUT_TRUNCATED_MARKER,
                                &truncated));
  }
  result.truncated = result.truncated || truncated;
  result.metadata["exit_code"] = std::to_string(output.exit_code);
  return result;
}

} // namespace

ToolExecutorService::ToolExecutorService(tools::ToolRegistry &registry, config::Config config,
                                         Dependencies dependencies)
    : registry_(registry), config_(std::move(config)), dependencies_(std::move(dependencies)) {
  if (dependencies_.runner && dependencies_.transport) {
    const auto ping = dependencies_.transport->ping();
    runtime_available_ = ping.ok();
    observability::record_runtime_check("docker", runtime_available_,
                                        ping.ok() ? "" : ping.error());
  } else {
    observability::record_runtime_check("docker", false, "not configured");
  }
  pool_ = std::make_unique<common::WorkerPool>(config_.execution.worker_threads);
}

ToolExecutorService::~ToolExecutorService() {
  // Drain queued calls first so nothing registers a container after the sweep.
  pool_.reset();
  for (const auto &entry : active_.snapshot()) {
    if (active_.erase(entry.execution_id).has_value()) {
      remove_container(entry.container_id, "service shutdown");
    }
  }
}

std::string ToolExecutorService::generate_execution_id() {
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  return "exec_" + std::to_string(now) + "_" + common::random_hex(6);
}

const config::SandboxConfig &
ToolExecutorService::default_sandbox_config(const tools::ITool &tool) const {
  return config_.profiles.for_category(tools::tool_category_to_string(tool.descriptor().category));
}

tools::ExecutionResult ToolExecutorService::execute(
    const std::string &tool_name, const tools::ToolArgs &parameters, const bool force_sandbox,
    const std::optional<config::SandboxConfig> &sandbox_config) {
  const std::string execution_id = generate_execution_id();
  const auto started = std::chrono::steady_clock::now();

  std::shared_ptr<tools::ITool> tool = registry_.get_tool(tool_name);
  if (tool == nullptr) {
    auto result = tools::ExecutionResult::failed(common::ErrorKind::NotFound,
                                                 "Tool '" + tool_name + "' not found");
    result.metadata["tool_name"] = tool_name;
    result.metadata["execution_id"] = execution_id;
    result.metadata["execution_mode"] = "error";
    return result;
  }

  const auto decision =
      executors::select_execution_mode(tool->descriptor(), force_sandbox, runtime_available_);
  if (decision.degraded) {
    observability::record_warning("executor", "Tool '" + tool_name + "': " + decision.reason);
  }

  ExecutionContext ctx{.tool = tool,
                       .parameters = parameters,
                       .mode = decision.mode,
                       .sandbox_config = sandbox_config.value_or(default_sandbox_config(*tool)),
                       .execution_id = execution_id,
                       .started = started,
                       .container_id = std::nullopt};

  std::string mode_label(tools::execution_mode_to_string(ctx.mode));
  observability::record_execution_start(execution_id, tool_name, mode_label);

  tools::ExecutionResult result;
  try {
    switch (ctx.mode) {
    case tools::ExecutionMode::Sandboxed:
      result = execute_sandboxed(ctx);
      break;
    case tools::ExecutionMode::Restricted:
      result = execute_restricted(ctx);
      break;
    case tools::ExecutionMode::Direct:
      result = execute_direct(ctx);
      break;
    }
  } catch (const std::exception &e) {
    observability::record_error("executor",
                                "Error executing tool '" + tool_name + "': " + e.what());
    result = tools::ExecutionResult::failed(common::ErrorKind::Runtime,
                                            std::string("Tool execution failed: ") + e.what());
    mode_label = "error";
  }

  cleanup_execution(execution_id);

  const auto elapsed = std::chrono::steady_clock::now() - started;
  result.metadata["execution_id"] = execution_id;
  result.metadata["execution_mode"] = mode_label;
  result.metadata["execution_time"] = common::seconds_text(elapsed);
  result.metadata["tool_name"] = tool_name;
  if (ctx.container_id.has_value()) {
    result.metadata["container_id"] = *ctx.container_id;
  }

  observability::record_execution_end(
      execution_id, tool_name, mode_label,
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed), result.success);
  return result;
}

std::future<tools::ExecutionResult>
ToolExecutorService::execute_async(std::string tool_name, tools::ToolArgs parameters,
                                   const bool force_sandbox,
                                   std::optional<config::SandboxConfig> sandbox_config) {
  return pool_->submit([this, tool_name = std::move(tool_name),
                        parameters = std::move(parameters), force_sandbox,
                        sandbox_config = std::move(sandbox_config)]() {
    return execute(tool_name, parameters, force_sandbox, sandbox_config);
  });
}

tools::ExecutionResult ToolExecutorService::execute_direct(ExecutionContext &ctx) {
  const tools::ToolContext tool_ctx{.execution_id = ctx.execution_id,
                                    .mode = ctx.mode,
                                    .scratch_dir = {}};
  return to_execution_result(ctx.tool->execute(ctx.parameters, tool_ctx));
}

tools::ExecutionResult ToolExecutorService::execute_restricted(ExecutionContext &ctx) {
  const auto timeout = std::chrono::seconds(config_.execution.tool_timeout_seconds);
  // The worker may outlive this call and the registry; it holds its own reference.
  std::shared_ptr<tools::ITool> tool = ctx.tool;
  const tools::ToolContext tool_ctx{.execution_id = ctx.execution_id,
                                    .mode = ctx.mode,
                                    .scratch_dir = {}};
  std::function<common::Result<tools::ExecutionResult>()> call =
      [tool, parameters = ctx.parameters, tool_ctx]() {
        return tool->execute(parameters, tool_ctx);
      };

  auto finished = executors::run_with_deadline<common::Result<tools::ExecutionResult>>(
      std::move(call), timeout);
  if (!finished.has_value()) {
    observability::record_warning("executor", "Tool '" + std::string(tool->name()) +
                                                  "' abandoned after deadline in restricted mode");
    auto result = tools::ExecutionResult::failed(
        common::ErrorKind::Timeout,
        "Tool execution timed out after " + std::to_string(timeout.count()) + " seconds");
    result.metadata["timeout"] = std::to_string(timeout.count());
    return result;
  }
  return to_execution_result(std::move(*finished));
}

tools::ExecutionResult ToolExecutorService::execute_sandboxed(ExecutionContext &ctx) {
  auto staged = stage_job(ctx);
  if (!staged.ok()) {
    return tools::ExecutionResult::failed(staged.kind(), staged.error());
  }
  StagedJob job = std::move(staged.value());

  const auto &cfg = ctx.sandbox_config;
  sandbox::ContainerSandbox box(cfg, dependencies_.runner, dependencies_.transport);
  if (auto created = box.create(); !created.ok()) {
    return tools::ExecutionResult::failed(common::ErrorKind::Security,
                                          "Sandbox preparation failed: " + created.error());
  }
  ctx.container_id = box.container_id();
  active_.insert(ActiveExecution{.execution_id = ctx.execution_id,
                                 .container_id = box.container_id(),
                                 .tool_name = std::string(ctx.tool->name()),
                                 .started = std::chrono::system_clock::now()});
  publish_active_count();

  const std::string job_dir = cfg.work_dir + "/" + JOB_DIRECTORY;
  tools::ExecutionResult result;
  if (auto copied = box.copy_to(job.scratch.path(), job_dir); !copied.ok()) {
    result = tools::ExecutionResult::failed(common::ErrorKind::Security,
                                            "Sandbox preparation failed: " + copied.error());
  } else {
    auto ran = box.run_command("cd " + common::shell_quote(job_dir) + " && " + job.command,
                               std::chrono::seconds(cfg.timeout_seconds));
    if (!ran.ok()) {
      const bool timed_out = ran.kind() == common::ErrorKind::SandboxTimeout;
      result = tools::ExecutionResult::failed(
          ran.kind(), timed_out ? ran.error() : "Container execution failed: " + ran.error());
    } else {
      result = classify_container_output(ctx, ran.value(), cfg.max_output_size);
    }
  }

  const auto problems = box.cleanup();
  for (const auto &problem : problems) {
    observability::record_warning("sandbox", problem);
  }
  if (problems.empty()) {
    active_.erase(ctx.execution_id);
    publish_active_count();
  }
  if (auto removed = job.scratch.remove(); !removed.ok()) {
    observability::record_warning("executor", removed.error());
  }
  return result;
}

void ToolExecutorService::publish_active_count() const {
  observability::record_metric(
      observability::ActiveExecutionsMetric{static_cast<std::uint64_t>(active_.size())});
}

bool ToolExecutorService::remove_container(const std::string &container_id,
                                           const std::string &reason) const {
  if (!dependencies_.runner || container_id.empty()) {
    return false;
  }
  auto killed = dependencies_.runner->run(
      {"kill", container_id},
      sandbox::DockerCommandOptions{.allow_failure = true, .timeout = KILL_TIMEOUT});
  observability::record_sandbox(container_id, "kill", killed.ok(), reason);

  auto removed = dependencies_.runner->run(
      {"rm", "-f", container_id},
      sandbox::DockerCommandOptions{.allow_failure = true, .timeout = KILL_TIMEOUT});
  if (!removed.ok()) {
    observability::record_sandbox(container_id, "remove", false, removed.error());
    return false;
  }
  const bool gone = removed.value().exit_code == 0 ||
                    sandbox::is_missing_container_error(removed.value().stderr_text);
  observability::record_sandbox(container_id, "remove", gone,
                                gone ? reason : common::trim(removed.value().stderr_text));
  return gone;
}

void ToolExecutorService::cleanup_execution(const std::string &execution_id) {
  // The sandbox removed its own container already; a leftover entry means that failed.
  if (auto entry = active_.erase(execution_id); entry.has_value()) {
    if (!remove_container(entry->container_id, "execution cleanup")) {
      observability::record_warning("executor",
                                    "Failed to cleanup container " + entry->container_id);
    }
    publish_active_count();
  }
}

std::vector<ActiveExecutionInfo> ToolExecutorService::list_active_executions() const {
  std::vector<ActiveExecutionInfo> out;
  if (!dependencies_.runner) {
    return out;
  }
  for (const auto &entry : active_.snapshot()) {
    auto inspected = dependencies_.runner->run(
        {"inspect", "--format", "{{.State.Status}}|{{.Created}}", entry.container_id},
        sandbox::DockerCommandOptions{.allow_failure = true, .timeout = INSPECT_TIMEOUT});
    if (!inspected.ok()) {
      observability::record_warning("executor", "inspect " + entry.container_id + ": " +
                                                    inspected.error());
      continue;
    }
    if (inspected.value().exit_code != 0) {
      // Finished between enumeration and lookup.
      continue;
    }
    const std::string line = common::trim(inspected.value().stdout_text);
    const auto bar = line.find('|');
    out.push_back(ActiveExecutionInfo{
        .execution_id = entry.execution_id,
        .container_id = entry.container_id,
        .status = line.substr(0, bar),
        .created = bar == std::string::npos ? std::string() : line.substr(bar + 1)});
  }
  return out;
}

bool ToolExecutorService::kill_execution(const std::string &execution_id) {
  const auto entry = active_.find(execution_id);
  if (!entry.has_value()) {
    return false;
  }
  // Stays registered until the container is really gone, so a later kill or the shutdown
  // sweep can retry.
  if (!remove_container(entry->container_id, "killed by request")) {
    observability::record_warning("executor", "Failed to kill container " + entry->container_id);
    return false;
  }
  active_.erase(execution_id);
  publish_active_count();
  return true;
}

} // namespace execbox::service
