#include "test_framework.hpp"

#include "execbox/tools/builtin/code_execution.hpp"
#include "execbox/tools/builtin/system_command.hpp"
#include "execbox/tools/builtin/text_statistics.hpp"
#include "execbox/tools/tool_registry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

namespace ex = execbox::executors;
namespace tl = execbox::tools;

std::shared_ptr<ex::SubprocessExecutor> shell_executor() {
  return std::make_shared<ex::SubprocessExecutor>(
      std::vector<ex::LanguageSpec>{ex::LanguageSpec{.name = "shell",
                                                     .extension = ".sh",
                                                     .command = {"sh"},
                                                     .default_timeout = std::chrono::seconds(10)}},
      10'000, false);
}

class NamedTool final : public tl::ITool {
public:
  NamedTool(std::string name, std::string marker)
      : descriptor_{.name = std::move(name),
                    .description = "",
                    .category = tl::ToolCategory::Analysis,
                    .is_safe = true,
                    .requires_sandbox = false},
        marker_(std::move(marker)) {}

  const tl::ToolDescriptor &descriptor() const override { return descriptor_; }
  execbox::common::Result<tl::ExecutionResult> execute(const tl::ToolArgs &,
                                                       const tl::ToolContext &) override {
    return execbox::common::Result<tl::ExecutionResult>::success(
        tl::ExecutionResult::succeeded(marker_));
  }

private:
  tl::ToolDescriptor descriptor_;
  std::string marker_;
};

tl::ExecutionResult run_ok(tl::ITool &tool, const tl::ToolArgs &args) {
  auto result = tool.execute(args, tl::ToolContext{});
  execbox::tests::require(result.ok(), "tool call failed: " + result.error());
  return result.value();
}

} // namespace

void register_tools_tests(std::vector<execbox::tests::TestCase> &tests) {
  using execbox::tests::require;
  using execbox::common::ErrorKind;

  tests.push_back({"registry_default_tools", [] {
                     const auto registry = tl::ToolRegistry::create_default(
                         execbox::testing::test_config(), nullptr, shell_executor());
                     require(registry.descriptors().size() == 3, "three tools");
                     require(registry.get_tool("code_execution") != nullptr, "code_execution");
                     require(registry.get_tool("system_command") != nullptr, "system_command");
                     require(registry.get_tool("text_statistics") != nullptr, "text_statistics");
                     require(registry.get_tool("missing") == nullptr, "unknown is null");
                   }});

  tests.push_back({"registry_lookup_is_case_insensitive_and_replaces", [] {
                     tl::ToolRegistry registry;
                     registry.register_tool(std::make_unique<NamedTool>("Echo", "first"));
                     require(registry.get_tool("ECHO") != nullptr, "upper case lookup");
                     registry.register_tool(std::make_unique<NamedTool>("echo", "second"));
                     require(registry.size() == 1, "replaced, not added");
                     require(run_ok(*registry.get_tool("echo"), {}).result == "second",
                             "newest registration wins");
                   }});

  tests.push_back({"descriptor_flags", [] {
                     const auto registry = tl::ToolRegistry::create_default(
                         execbox::testing::test_config(), nullptr, shell_executor());
                     const auto &code = registry.get_tool("code_execution")->descriptor();
                     require(!code.is_safe && code.requires_sandbox, "code is isolated");
                     require(code.category == tl::ToolCategory::Development, "development");
                     const auto &stats = registry.get_tool("text_statistics")->descriptor();
                     require(stats.is_safe && stats.category == tl::ToolCategory::Analysis,
                             "statistics is safe analysis");
                     require(registry.get_tool("system_command")->descriptor().category ==
                                 tl::ToolCategory::System,
                             "system");
                   }});

  tests.push_back({"text_statistics_counts", [] {
                     const auto empty = tl::compute_text_statistics("");
                     require(empty.lines == 0 && empty.words == 0 && empty.characters == 0, "empty");

                     const auto two = tl::compute_text_statistics("hello world\nsecond line\n");
                     require(two.lines == 2, "trailing newline adds no line");
                     require(two.words == 4, "four words");
                     require(two.characters == 24, "characters");

                     const auto open = tl::compute_text_statistics("a\nb");
                     require(open.lines == 2, "unterminated last line counts");

                     const auto utf8 = tl::compute_text_statistics("caf\xC3\xA9  \t na\xC3\xAFve");
                     require(utf8.characters == 13, "code points, not bytes");
                     require(utf8.words == 2, "whitespace runs split once");
                   }});

  tests.push_back({"text_statistics_tool_output", [] {
                     tl::TextStatisticsTool tool;
                     const auto result = run_ok(tool, {{"text", "one two"}});
                     require(result.success, "success");
                     require(result.result == "{\"lines\":1,\"words\":2,\"characters\":7}",
                             result.result);
                     require(result.metadata.at("output_length") ==
                                 std::to_string(result.result.size()),
                             "output length");

                     const auto missing = tool.execute({}, tl::ToolContext{});
                     require(!missing.ok() && missing.kind() == ErrorKind::Validation,
                             "missing text");
                   }});

  tests.push_back({"code_execution_requires_code", [] {
                     tl::CodeExecutionTool tool({}, nullptr, shell_executor());
                     for (const tl::ToolArgs &args :
                          {tl::ToolArgs{}, tl::ToolArgs{{"code", "  \n"}}}) {
                       const auto result = tool.execute(args, tl::ToolContext{});
                       require(!result.ok(), "rejected");
                       require(result.kind() == ErrorKind::Validation, "validation");
                       require(result.error() == "No code provided", result.error());
                     }
                   }});

  tests.push_back({"code_execution_timeout_is_clamped", [] {
                     execbox::config::CodeExecutionConfig config;
                     config.default_timeout_seconds = 300;
                     tl::CodeExecutionTool tool(config, nullptr, shell_executor());

                     const auto absent = tool.parse_timeout({});
                     require(absent.ok() && absent.value().count() == 60, "default clamped");
                     require(tool.parse_timeout({{"timeout", "0"}}).value().count() == 1, "low");
                     require(tool.parse_timeout({{"timeout", "2.9"}}).value().count() == 2,
                             "fraction");
                     require(tool.parse_timeout({{"timeout", "1e9"}}).value().count() == 60,
                             "huge");
                     const auto bad = tool.parse_timeout({{"timeout", "soon"}});
                     require(!bad.ok() && bad.kind() == ErrorKind::Validation, "invalid");
                     require(bad.error() == "Invalid timeout: soon", bad.error());
                   }});

  tests.push_back({"code_execution_unsupported_language", [] {
                     tl::CodeExecutionTool tool({}, nullptr, shell_executor());
                     const auto result = tool.execute({{"code", "x"}, {"language", "Ruby"}},
                                                      tl::ToolContext{});
                     require(!result.ok() && result.kind() == ErrorKind::Validation, "rejected");
                     require(result.error() == "Language 'ruby' not supported. Available: shell",
                             result.error());
                   }});

  tests.push_back({"code_execution_routes_to_subprocess", [] {
                     tl::CodeExecutionTool tool({}, nullptr, shell_executor());
                     const auto result =
                         run_ok(tool, {{"code", "echo from-shell"}, {"language", "shell"}});
                     require(result.success, "success: " + result.error);
                     require(result.result == "from-shell\n", result.result);
                     require(result.metadata.at("language") == "shell", "language recorded");
                   }});

  tests.push_back({"code_execution_python_without_runtimes", [] {
                     tl::CodeExecutionTool tool({}, nullptr, shell_executor());
                     const auto result = tool.execute({{"code", "print(1)"}}, tl::ToolContext{});
                     require(!result.ok(), "python unavailable");
                     require(result.error().find("Language 'python' not supported") == 0,
                             result.error());
                   }});

  tests.push_back({"system_command_runs_shell", [] {
                     tl::SystemCommandTool tool(shell_executor(), std::chrono::seconds(5));
                     const auto result = run_ok(tool, {{"command", "echo $((6 * 7))"}});
                     require(result.success, "success");
                     require(result.result == "42\n", result.result);
                     require(result.metadata.at("command") == "echo $((6 * 7))", "command kept");

                     const auto missing = tool.execute({}, tl::ToolContext{});
                     require(!missing.ok() && missing.kind() == ErrorKind::Validation,
                             "command required");
                   }});

  tests.push_back({"system_command_without_shell", [] {
                     tl::SystemCommandTool tool(nullptr, std::chrono::seconds(5));
                     const auto result = tool.execute({{"command", "true"}}, tl::ToolContext{});
                     require(!result.ok() && result.kind() == ErrorKind::Runtime, "runtime error");
                   }});

  tests.push_back({"execution_result_json_round_trip", [] {
                     auto original = tl::ExecutionResult::failed(ErrorKind::Timeout, "slow \"op\"");
                     original.result = "line1\nline2";
                     original.truncated = true;
                     original.metadata["timeout"] = "3";
                     const auto parsed = tl::ExecutionResult::from_json(original.to_json());
                     require(parsed.ok(), "parsed");
                     require(!parsed.value().success, "failure kept");
                     require(parsed.value().error == "slow \"op\"", "escaped error");
                     require(parsed.value().result == "line1\nline2", "newlines");
                     require(parsed.value().truncated, "truncated");
                     require(parsed.value().metadata.at("error_type") == "TimeoutError", "kind");
                     require(parsed.value().metadata.at("timeout") == "3", "metadata");

                     require(!tl::ExecutionResult::from_json("plain output").ok(), "not json");
                   }});
}
