#include "execbox/cli/commands.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/common/json_util.hpp"
#include "execbox/config/config.hpp"
#include "execbox/executors/python_runtime.hpp"
#include "execbox/executors/restricted_executor.hpp"
#include "execbox/executors/subprocess_executor.hpp"
#include "execbox/observability/factory.hpp"
#include "execbox/observability/global.hpp"
#include "execbox/sandbox/docker.hpp"
#include "execbox/sandbox/engine_api.hpp"
#include "execbox/service/tool_executor_service.hpp"
#include "execbox/tools/tool_registry.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace execbox::cli {

namespace {

std::string version_string() {
#ifdef EXECBOX_VERSION
  std::string version = EXECBOX_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "execbox " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

// Everything a command needs to run tools: config, executors and the registry.
struct Runtime {
  config::Config config;
  std::shared_ptr<executors::RestrictedExecutor> restricted;
  std::shared_ptr<executors::SubprocessExecutor> subprocess;
  tools::ToolRegistry registry;
};

common::Result<std::unique_ptr<Runtime>> load_runtime() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(cfg.kind(), cfg.error());
  }
  const auto issues = config::validate_config(cfg.value());
  if (!issues.empty()) {
    std::string message = "invalid configuration:";
    for (const auto &issue : issues) {
      message += "\n  " + issue;
    }
    return common::Result<std::unique_ptr<Runtime>>::failure(common::ErrorKind::Validation,
                                                             message);
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = std::move(cfg.value());
  observability::set_global_observer(
      observability::create_observer(runtime->config.execution.observer));

  const auto &code = runtime->config.code_execution;
  runtime->restricted = std::make_shared<executors::RestrictedExecutor>(code.max_output_chars);
  runtime->subprocess = std::make_shared<executors::SubprocessExecutor>(
      executors::default_languages(code), code.max_output_chars);
  runtime->registry = tools::ToolRegistry::create_default(runtime->config, runtime->restricted,
                                                          runtime->subprocess);
  return common::Result<std::unique_ptr<Runtime>>::success(std::move(runtime));
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: execbox [--config <path>] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run <tool> [--param key=value]... [--param-file key=path]... [--force-sandbox]\n";
  std::cout << "      Execute a tool at the isolation level its risk requires; prints JSON.\n";
  std::cout << "  tool <tool> --params <file>\n";
  std::cout << "      Run a tool in-process from a JSON parameter file; prints JSON.\n";
  std::cout << "  tools      List registered tools\n";
  std::cout << "  doctor     Check the container runtime and interpreters\n";
  std::cout << "  version    Print the version\n";
  std::cout << "  help       Show this message\n";
}

int run_run(std::vector<std::string> args) {
  const bool force_sandbox = take_flag(args, "--force-sandbox");

  tools::ToolArgs params;
  std::string value;
  while (take_option(args, "--param", "-p", value)) {
    const auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "--param expects key=value, got: " << value << "\n";
      return 1;
    }
    params[value.substr(0, eq)] = value.substr(eq + 1);
  }
  while (take_option(args, "--param-file", "", value)) {
    const auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "--param-file expects key=path, got: " << value << "\n";
      return 1;
    }
    auto content = common::read_file(common::expand_path(value.substr(eq + 1)));
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    params[value.substr(0, eq)] = content.value();
  }

  if (args.size() != 1) {
    std::cerr << "Usage: execbox run <tool> [--param key=value]... [--force-sandbox]\n";
    return 1;
  }

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();

  const auto &execution = rt.config.execution;
  service::ToolExecutorService service(
      rt.registry, rt.config,
      service::ToolExecutorService::Dependencies{
          .runner = std::make_shared<sandbox::DockerCliRunner>(execution.docker_binary),
          .transport = std::make_shared<sandbox::DockerEngineClient>(execution.docker_socket)});

  const auto result = service.execute(args[0], params, force_sandbox);
  std::cout << result.to_json() << "\n";
  return result.success ? 0 : 1;
}

// Runs inside a sandbox container through the generated wrapper script. The result
// document on stdout is the contract; the exit status only reports whether one was written.
int run_tool(std::vector<std::string> args) {
  std::string params_path;
  if (!take_option(args, "--params", "", params_path) || args.size() != 1) {
    std::cerr << "Usage: execbox tool <tool> --params <file>\n";
    return 1;
  }

  auto content = common::read_file(params_path);
  if (!content.ok()) {
    std::cerr << content.error() << "\n";
    return 1;
  }

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cout << tools::ExecutionResult::failed(runtime.kind(), runtime.error()).to_json() << "\n";
    return 0;
  }
  auto &rt = *runtime.value();

  const auto tool = rt.registry.get_tool(args[0]);
  if (tool == nullptr) {
    std::cout << tools::ExecutionResult::failed(common::ErrorKind::NotFound,
                                                "Tool '" + args[0] + "' not found")
                     .to_json()
              << "\n";
    return 0;
  }

  tools::ToolArgs params;
  for (auto &[key, val] : common::json_parse_flat(content.value())) {
    params[key] = std::move(val);
  }
  const tools::ToolContext ctx{.execution_id = service::ToolExecutorService::generate_execution_id(),
                               .mode = tools::ExecutionMode::Direct,
                               .scratch_dir = {}};
  auto result = tool->execute(params, ctx);
  if (!result.ok()) {
    std::cout << tools::ExecutionResult::failed(result.kind(), result.error()).to_json() << "\n";
    return 0;
  }
  std::cout << result.value().to_json() << "\n";
  return 0;
}

int run_tools() {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  for (const auto &desc : runtime.value()->registry.descriptors()) {
    std::cout << desc.name << "  [" << tools::tool_category_to_string(desc.category) << ", "
              << (desc.is_safe ? "safe" : "unsafe")
              << (desc.requires_sandbox ? ", sandbox" : "") << "]\n";
    std::cout << "    " << desc.description << "\n";
  }
  return 0;
}

int run_doctor() {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << "[FAIL] Config load: " << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();
  int failed = 0;

  if (auto path = config::config_path(); path.ok()) {
    std::cout << "[ OK ] Config: " << path.value().string() << "\n";
  }

  sandbox::DockerEngineClient engine(rt.config.execution.docker_socket);
  if (auto ping = engine.ping(); ping.ok()) {
    std::cout << "[ OK ] Docker engine at " << rt.config.execution.docker_socket << "\n";
  } else {
    std::cout << "[WARN] Docker engine unavailable (" << ping.error()
              << "); unsafe tools fall back to restricted mode\n";
  }

  sandbox::DockerCliRunner cli(rt.config.execution.docker_binary);
  if (auto version = cli.run({"version", "--format", "{{.Client.Version}}"},
                             sandbox::DockerCommandOptions{.allow_failure = true});
      version.ok() && version.value().exit_code == 0) {
    std::cout << "[ OK ] Docker CLI " << common::trim(version.value().stdout_text) << "\n";
  } else {
    std::cout << "[WARN] Docker CLI '" << rt.config.execution.docker_binary
              << "' not usable\n";
  }

  const auto &python = executors::EmbeddedPython::instance();
  if (python.available()) {
    std::cout << "[ OK ] Embedded Python " << python.version() << "\n";
  } else {
    std::cout << "[FAIL] Embedded Python: " << python.init_error() << "\n";
    ++failed;
  }

  const auto languages = rt.subprocess->available_languages();
  if (languages.empty()) {
    std::cout << "[WARN] No subprocess interpreters found\n";
  } else {
    std::string joined;
    for (const auto &lang : languages) {
      joined += (joined.empty() ? "" : ", ") + lang;
    }
    std::cout << "[ OK ] Subprocess languages: " << joined << "\n";
  }
  return failed == 0 ? 0 : 1;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "tool") {
    return run_tool(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools();
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace execbox::cli
