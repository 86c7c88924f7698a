#pragma once

#include "execbox/common/result.hpp"
#include "execbox/config/schema.hpp"
#include "execbox/sandbox/command_channel.hpp"
#include "execbox/sandbox/docker.hpp"
#include "execbox/sandbox/engine_api.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::sandbox {

enum class SandboxState { Uninitialized, Creating, Running, Exited, Failed, Cleaned };

[[nodiscard]] std::string_view sandbox_state_to_string(SandboxState state);

/// `docker create` arguments for a sandbox named `name` whose working directory is bound to
/// `host_workdir`.
[[nodiscard]] std::vector<std::string>
build_container_create_args(const config::SandboxConfig &config, const std::string &name,
                            const std::filesystem::path &host_workdir);

/// CPU quota in microseconds per 100ms period for a fractional core count.
[[nodiscard]] long cpu_quota_for_share(double cpu_share);

/// One container with its own host working directory.
///
/// Lifecycle: UNINITIALIZED -> CREATING -> RUNNING -> {EXITED | FAILED} -> CLEANED. Every
/// path handed to the file operations is resolved against `work_dir` and refused if it
/// holds a `..` segment before any archive is built or transferred. Not thread-safe; one
/// owner drives it.
class ContainerSandbox {
public:
  ContainerSandbox(config::SandboxConfig config, std::shared_ptr<IDockerRunner> runner,
                   std::shared_ptr<IArchiveTransport> transport);
  ~ContainerSandbox();

  ContainerSandbox(const ContainerSandbox &) = delete;
  ContainerSandbox &operator=(const ContainerSandbox &) = delete;

  /// Allocate, start and attach. On any failure everything acquired so far is released and
  /// the sandbox ends CLEANED.
  [[nodiscard]] common::Status create();

  /// `timeout` defaults to the config's timeout. A deadline miss kills and removes the
  /// container and returns SandboxTimeout.
  [[nodiscard]] common::Result<CommandOutput>
  run_command(const std::string &command,
              std::optional<std::chrono::seconds> timeout = std::nullopt);

  [[nodiscard]] common::Result<std::string> read_file(const std::string &path);
  [[nodiscard]] common::Status write_file(const std::string &path, const std::string &content);
  [[nodiscard]] common::Status copy_from(const std::string &container_path,
                                         const std::filesystem::path &host_path);
  [[nodiscard]] common::Status copy_to(const std::filesystem::path &host_path,
                                       const std::string &container_path);

  /// Idempotent. Returns every problem met while releasing resources; a second call
  /// returns nothing.
  std::vector<std::string> cleanup();

  [[nodiscard]] SandboxState state() const { return state_; }
  [[nodiscard]] const std::string &container_id() const { return container_id_; }
  [[nodiscard]] const std::string &container_name() const { return container_name_; }
  [[nodiscard]] const std::filesystem::path &host_workdir() const { return host_workdir_; }
  [[nodiscard]] const config::SandboxConfig &config() const { return config_; }

private:
  [[nodiscard]] common::Status require_running(std::string_view operation) const;
  [[nodiscard]] common::Status ensure_directory(const std::string &directory);
  void force_remove(const std::string &reason);

  config::SandboxConfig config_;
  std::shared_ptr<IDockerRunner> runner_;
  std::shared_ptr<IArchiveTransport> transport_;
  std::unique_ptr<ICommandChannel> channel_;
  SandboxState state_ = SandboxState::Uninitialized;
  std::string container_name_;
  std::string container_id_;
  std::filesystem::path host_workdir_;
};

} // namespace execbox::sandbox
