#include "execbox/sandbox/docker.hpp"

#include "execbox/common/process.hpp"

namespace execbox::sandbox {

namespace {

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

} // namespace

DockerCliRunner::DockerCliRunner(std::string binary) : binary_(std::move(binary)) {}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure(common::ErrorKind::Validation,
                                                        "docker command is empty");
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  common::ProcessOptions process_options;
  process_options.timeout = options.timeout;
  process_options.stdin_data = options.stdin_data;
  process_options.max_stdout_bytes = 16 * 1024 * 1024;
  process_options.max_stderr_bytes = 1024 * 1024;
  // The CLI is the only child; docker itself owns the container processes.
  process_options.new_process_group = false;

  auto ran = common::run_process(argv, process_options);
  if (!ran.ok()) {
    return common::Result<DockerProcessResult>::failure(ran.error());
  }

  auto &process = ran.value();
  DockerProcessResult result;
  result.exit_code = process.exit_code;
  result.stdout_text = std::move(process.stdout_text);
  result.stderr_text = std::move(process.stderr_text);
  result.timed_out = process.timed_out;

  if (result.timed_out) {
    return common::Result<DockerProcessResult>::failure(common::ErrorKind::Timeout,
                                                        "docker command timed out: " +
                                                            join_args(args));
  }

  if (result.exit_code == 127 && result.stdout_text.empty() && result.stderr_text.empty()) {
    return common::Result<DockerProcessResult>::failure("docker binary not found: " + binary_);
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + join_args(args)
                                    : result.stderr_text;
    const auto kind = is_missing_container_error(result.stderr_text) ? common::ErrorKind::NotFound
                                                                     : common::ErrorKind::Runtime;
    return common::Result<DockerProcessResult>::failure(kind, message);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

bool is_missing_container_error(const std::string &stderr_text) {
  return stderr_text.find("No such container") != std::string::npos ||
         stderr_text.find("No such object") != std::string::npos;
}

} // namespace execbox::sandbox
