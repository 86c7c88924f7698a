#include "test_framework.hpp"

#include "execbox/cli/commands.hpp"
#include "execbox/config/config.hpp"
#include "execbox/observability/global.hpp"
#include "execbox/observability/noop_observer.hpp"
#include "execbox/tools/tool.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun invoke(std::vector<std::string> args) {
  args.insert(args.begin(), "execbox");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  CliRun run;
  try {
    run.code = execbox::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  } catch (...) {
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    throw;
  }
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  run.out = out.str();
  run.err = err.str();
  return run;
}

// Points the CLI at a quiet config for the lifetime of the guard.
class ConfigFile {
public:
  ConfigFile() {
    workspace_.create_file("config.toml", "[execution]\nobserver = \"none\"\n");
    execbox::config::set_config_path_override(workspace_.path() / "config.toml");
  }
  ~ConfigFile() {
    execbox::config::set_config_path_override(std::nullopt);
    execbox::observability::set_global_observer(
        std::make_unique<execbox::observability::NoopObserver>());
  }

  [[nodiscard]] const execbox::testing::TempWorkspace &workspace() const { return workspace_; }

private:
  execbox::testing::TempWorkspace workspace_;
};

} // namespace

void register_cli_tests(std::vector<execbox::tests::TestCase> &tests) {
  using execbox::tests::require;

  tests.push_back({"cli_help_and_version", [] {
                     const auto help = invoke({"help"});
                     require(help.code == 0, "help exits 0");
                     require(help.out.find("Usage: execbox") != std::string::npos, help.out);
                     require(invoke({}).code == 0, "no command prints help");

                     const auto version = invoke({"--version"});
                     require(version.code == 0, "version exits 0");
                     require(version.out.rfind("execbox ", 0) == 0, version.out);
                   }});

  tests.push_back({"cli_rejects_bad_usage", [] {
                     const auto unknown = invoke({"frobnicate"});
                     require(unknown.code == 1, "unknown command");
                     require(unknown.err.find("Unknown command: frobnicate") != std::string::npos,
                             unknown.err);
                     require(invoke({"--config"}).code == 1, "missing config value");
                     require(invoke({"run"}).code == 1, "run needs a tool");

                     const auto bad_param = invoke({"run", "text_statistics", "--param", "text"});
                     require(bad_param.code == 1, "param without '='");
                     require(bad_param.err.find("--param expects key=value") != std::string::npos,
                             bad_param.err);
                     require(invoke({"tool", "text_statistics"}).code == 1, "tool needs --params");
                   }});

  tests.push_back({"cli_tool_prints_result_document", [] {
                     ConfigFile config;
                     config.workspace().create_file("params.json", "{\"text\":\"one two three\"}");
                     const auto run = invoke({"tool", "text_statistics", "--params",
                                              (config.workspace().path() / "params.json").string()});
                     require(run.code == 0, "document printed: " + run.err);
                     const auto parsed = execbox::tools::ExecutionResult::from_json(run.out);
                     require(parsed.ok(), "json output: " + run.out);
                     require(parsed.value().success, "success");
                     require(parsed.value().result == "{\"lines\":1,\"words\":3,\"characters\":13}",
                             parsed.value().result);
                   }});

  tests.push_back({"cli_tool_reports_unknown_tool_as_document", [] {
                     ConfigFile config;
                     config.workspace().create_file("params.json", "{}");
                     const auto run = invoke({"tool", "nope", "--params",
                                              (config.workspace().path() / "params.json").string()});
                     require(run.code == 0, "document printed");
                     const auto parsed = execbox::tools::ExecutionResult::from_json(run.out);
                     require(parsed.ok() && !parsed.value().success, "failure document");
                     require(parsed.value().error == "Tool 'nope' not found", parsed.value().error);
                   }});

  tests.push_back({"cli_run_direct_tool", [] {
                     ConfigFile config;
                     const auto run = invoke({"run", "text_statistics", "-p", "text=a b"});
                     require(run.code == 0, "success exit: " + run.out + run.err);
                     const auto parsed = execbox::tools::ExecutionResult::from_json(run.out);
                     require(parsed.ok(), "json output");
                     require(parsed.value().metadata.at("execution_mode") == "direct", "direct");

                     const auto missing = invoke({"run", "nope"});
                     require(missing.code == 1, "failed call exits 1");
                   }});
}
