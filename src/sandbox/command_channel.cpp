#include "execbox/sandbox/command_channel.hpp"

namespace execbox::sandbox {

DockerExecChannel::DockerExecChannel(std::shared_ptr<IDockerRunner> runner,
                                     std::string container_id, std::string work_dir)
    : runner_(std::move(runner)), container_id_(std::move(container_id)),
      work_dir_(std::move(work_dir)) {}

common::Status DockerExecChannel::open() {
  if (!runner_) {
    return common::Status::error("docker runner unavailable");
  }
  auto ready = runner_->run({"exec", container_id_, "true"},
                            DockerCommandOptions{.timeout = std::chrono::seconds(15)});
  if (!ready.ok()) {
    return common::Status::error(ready.kind(), "command channel check failed: " + ready.error());
  }
  open_ = true;
  return common::Status::success();
}

common::Result<CommandOutput> DockerExecChannel::run(const std::string &command,
                                                     const std::chrono::milliseconds timeout) {
  if (!open_) {
    return common::Result<CommandOutput>::failure("command channel is closed");
  }
  auto ran = runner_->run({"exec", "-w", work_dir_, container_id_, "sh", "-c", command},
                          DockerCommandOptions{.allow_failure = true, .timeout = timeout});
  if (!ran.ok()) {
    return common::Result<CommandOutput>::failure(ran.kind(), ran.error());
  }
  auto &process = ran.value();
  return common::Result<CommandOutput>::success(CommandOutput{
      .exit_code = process.exit_code,
      .stdout_text = std::move(process.stdout_text),
      .stderr_text = std::move(process.stderr_text),
  });
}

common::Status DockerExecChannel::close() {
  // Each exec is its own process, so there is no session left to tear down.
  open_ = false;
  return common::Status::success();
}

} // namespace execbox::sandbox
