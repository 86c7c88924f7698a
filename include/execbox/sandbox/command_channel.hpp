#pragma once

#include "execbox/common/result.hpp"
#include "execbox/sandbox/docker.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace execbox::sandbox {

struct CommandOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Interactive command path into a running container.
class ICommandChannel {
public:
  virtual ~ICommandChannel() = default;

  [[nodiscard]] virtual common::Status open() = 0;
  /// Run `command` through `sh -c`. A deadline miss is a Timeout failure.
  [[nodiscard]] virtual common::Result<CommandOutput> run(const std::string &command,
                                                          std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status close() = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/// `docker exec` into one container. Opening runs a trial exec.
class DockerExecChannel final : public ICommandChannel {
public:
  DockerExecChannel(std::shared_ptr<IDockerRunner> runner, std::string container_id,
                    std::string work_dir);

  [[nodiscard]] common::Status open() override;
  [[nodiscard]] common::Result<CommandOutput> run(const std::string &command,
                                                  std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status close() override;
  [[nodiscard]] bool is_open() const override { return open_; }

private:
  std::shared_ptr<IDockerRunner> runner_;
  std::string container_id_;
  std::string work_dir_;
  bool open_ = false;
};

} // namespace execbox::sandbox
