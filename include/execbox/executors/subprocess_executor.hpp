#pragma once

#include "execbox/config/schema.hpp"
#include "execbox/tools/tool.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace execbox::executors {

struct LanguageSpec {
  std::string name;
  std::string extension;
  std::vector<std::string> command;
  std::chrono::seconds default_timeout{30};
};

/// python, javascript, typescript, bash and shell, with interpreters taken from `config`.
[[nodiscard]] std::vector<LanguageSpec> default_languages(const config::CodeExecutionConfig &config);

/// Runs source through an external interpreter in a private scratch directory.
class SubprocessExecutor {
public:
  /// Runs each interpreter with `--version` unless `check_interpreters` is false, in which
  /// case every language counts as available.
  SubprocessExecutor(std::vector<LanguageSpec> languages, std::size_t max_output_chars,
                     bool check_interpreters = true);

  [[nodiscard]] const LanguageSpec *find_language(const std::string &name) const;
  [[nodiscard]] bool is_available(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> available_languages() const;

  /// `scratch_root` empty means a fresh temp directory; otherwise the file is written there.
  /// `timeout` of zero uses the language default.
  [[nodiscard]] tools::ExecutionResult execute(const std::string &language, const std::string &code,
                                               std::chrono::seconds timeout,
                                               const std::filesystem::path &scratch_root = {}) const;

private:
  std::vector<LanguageSpec> languages_;
  std::vector<std::string> available_;
  std::size_t max_output_chars_;
};

} // namespace execbox::executors
