#pragma once

#include "execbox/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace execbox::sandbox {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::string stdin_data;
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

/// Runs docker CLI subcommands. Without `allow_failure`, a non-zero exit becomes a failure
/// Result carrying stderr; a timeout is always a Timeout failure.
class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker");

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
};

/// True when `stderr_text` says the container does not exist (already removed).
[[nodiscard]] bool is_missing_container_error(const std::string &stderr_text);

} // namespace execbox::sandbox
