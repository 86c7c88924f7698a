#include "execbox/executors/subprocess_executor.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/common/process.hpp"
#include "execbox/common/random.hpp"
#include "execbox/common/text.hpp"
#include "execbox/observability/global.hpp"

#include <algorithm>

namespace execbox::executors {

namespace {

bool interpreter_responds(const std::string &binary) {
  common::ProcessOptions options;
  options.timeout = std::chrono::seconds(5);
  options.max_stdout_bytes = 4096;
  options.max_stderr_bytes = 4096;
  const auto version_run = common::run_process({binary, "--version"}, options);
  return version_run.ok() && !version_run.value().timed_out && version_run.value().exit_code == 0;
}

} // namespace

std::vector<LanguageSpec> default_languages(const config::CodeExecutionConfig &config) {
  return {
      LanguageSpec{.name = "python",
                   .extension = ".py",
                   .command = {config.python_command},
                   .default_timeout = std::chrono::seconds(30)},
      LanguageSpec{.name = "javascript",
                   .extension = ".js",
                   .command = {config.node_command},
                   .default_timeout = std::chrono::seconds(15)},
      LanguageSpec{.name = "typescript",
                   .extension = ".ts",
                   .command = {"ts-node"},
                   .default_timeout = std::chrono::seconds(15)},
      LanguageSpec{.name = "bash",
                   .extension = ".sh",
                   .command = {"bash"},
                   .default_timeout = std::chrono::seconds(10)},
      LanguageSpec{.name = "shell",
                   .extension = ".sh",
                   .command = {"sh"},
                   .default_timeout = std::chrono::seconds(10)},
  };
}

SubprocessExecutor::SubprocessExecutor(std::vector<LanguageSpec> languages,
                                       const std::size_t max_output_chars, const bool check_interpreters)
    : languages_(std::move(languages)), max_output_chars_(max_output_chars) {
  for (const auto &language : languages_) {
    if (language.command.empty()) {
      continue;
    }
    const bool found = !check_interpreters || interpreter_responds(language.command.front());
    if (found) {
      available_.push_back(language.name);
    }
    if (check_interpreters) {
      observability::record_runtime_check(language.name, found, language.command.front());
    }
  }
}

const LanguageSpec *SubprocessExecutor::find_language(const std::string &name) const {
  const std::string wanted = common::to_lower(common::trim(name));
  for (const auto &language : languages_) {
    if (language.name == wanted) {
      return &language;
    }
  }
  return nullptr;
}

bool SubprocessExecutor::is_available(const std::string &name) const {
  const std::string wanted = common::to_lower(common::trim(name));
  return std::find(available_.begin(), available_.end(), wanted) != available_.end();
}

std::vector<std::string> SubprocessExecutor::available_languages() const { return available_; }

tools::ExecutionResult SubprocessExecutor::execute(const std::string &language,
                                                   const std::string &code,
                                                   std::chrono::seconds timeout,
                                                   const std::filesystem::path &scratch_root) const {
  const LanguageSpec *spec = find_language(language);
  if (spec == nullptr || !is_available(spec->name)) {
    return tools::ExecutionResult::failed(common::ErrorKind::Validation,
                                          "Unsupported language: " + language);
  }
  if (timeout.count() <= 0) {
    timeout = spec->default_timeout;
  }

  // Owns the directory only when we created it.
  common::ScratchDirectory owned;
  std::filesystem::path dir = scratch_root;
  if (dir.empty()) {
    auto created = common::ScratchDirectory::create("execbox_run_");
    if (!created.ok()) {
      return tools::ExecutionResult::failed(common::ErrorKind::Runtime,
                                            "Execution error: " + created.error());
    }
    owned = std::move(created.value());
    dir = owned.path();
  }

  const auto script = dir / ("code_" + common::random_hex(8) + spec->extension);
  if (const auto written = common::write_file(script, code); !written.ok()) {
    return tools::ExecutionResult::failed(common::ErrorKind::Runtime,
                                          "Execution error: " + written.error());
  }

  common::ProcessOptions options;
  options.working_dir = dir;
  options.env = {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONUNBUFFERED", "1"}};
  options.timeout = timeout;
  // Read one byte past the cap so truncation is detectable.
  options.max_stdout_bytes = max_output_chars_ + 1;
  options.max_stderr_bytes = max_output_chars_ + 1;
  options.new_process_group = true;

  std::vector<std::string> argv = spec->command;
  argv.push_back(script.string());

  const auto started = std::chrono::steady_clock::now();
  const auto ran = common::run_process(argv, options);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  std::error_code ec;
  std::filesystem::remove(script, ec);

  if (!ran.ok()) {
    auto result = tools::ExecutionResult::failed(common::ErrorKind::Runtime,
                                                 "Execution error: " + ran.error());
    result.metadata["language"] = spec->name;
    return result;
  }

  const auto &process = ran.value();
  if (process.timed_out) {
    auto result = tools::ExecutionResult::failed(
        common::ErrorKind::Timeout,
        "Code execution timed out after " + std::to_string(timeout.count()) + " seconds");
    result.metadata["language"] = spec->name;
    result.metadata["timeout"] = std::to_string(timeout.count());
    result.metadata["restricted"] = "false";
    return result;
  }

  bool stdout_cut = false;
  bool stderr_cut = false;
  const std::string out = common::truncate_output(process.stdout_text, max_output_chars_,
                                                  common::OUTPUT_TRUNCATED_MARKER, &stdout_cut);
  const std::string err = common::truncate_output(
      process.stderr_text, max_output_chars_, common::ERROR_OUTPUT_TRUNCATED_MARKER, &stderr_cut);

  tools::ExecutionResult result;
  result.success = process.exit_code == 0;
  result.truncated = stdout_cut || stderr_cut;
  result.result = out;
  if (!result.success) {
    result.error = err.empty() ? "Process exited with code " + std::to_string(process.exit_code)
                               : err;
    result.metadata["error_type"] =
        std::string(common::error_kind_to_string(common::ErrorKind::Runtime));
  }
  result.metadata["language"] = spec->name;
  result.metadata["execution_time"] = common::seconds_text(elapsed);
  result.metadata["return_code"] = std::to_string(process.exit_code);
  result.metadata["restricted"] = "false";
  result.metadata["output_length"] = std::to_string(result.result.size());
  if (!err.empty() && result.success) {
    result.metadata["stderr"] = err;
  }
  return result;
}

} // namespace execbox::executors
