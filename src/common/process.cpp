#include "execbox/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace execbox::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Returns false once the pipe hit EOF.
bool read_capped(const int fd, std::string &buffer, const std::size_t cap, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const std::size_t remaining = cap > buffer.size() ? cap - buffer.size() : 0;
      const std::size_t to_copy = std::min<std::size_t>(remaining, static_cast<std::size_t>(bytes));
      buffer.append(chunk.data(), to_copy);
      if (to_copy < static_cast<std::size_t>(bytes)) {
        truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

std::vector<std::string> build_environment(const ProcessOptions &options) {
  std::vector<std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    const auto eq = item.find('=');
    const std::string key = item.substr(0, eq);
    bool overridden = false;
    for (const auto &[name, value] : options.env) {
      if (name == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.push_back(item);
    }
  }
  for (const auto &[name, value] : options.env) {
    env.push_back(name + "=" + value);
  }
  return env;
}

} // namespace

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return Result<ProcessResult>::failure(ErrorKind::Validation, "command is empty");
  }

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  // Close-on-exec so children forked concurrently by other calls never inherit these ends;
  // dup2 clears the flag on the child's own stdio.
  if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
      pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  // Everything the child touches is prepared before fork.
  const auto env_strings = build_environment(options);
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (const auto &item : env_strings) {
    envp.push_back(const_cast<char *>(item.c_str()));
  }
  envp.push_back(nullptr);

  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);
  const std::string cwd = options.working_dir.string();

  const pid_t pid = fork();
  if (pid < 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    if (options.new_process_group) {
      (void)setpgid(0, 0);
    }
    (void)dup2(stdin_pipe[0], STDIN_FILENO);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close(fds[0]);
      close(fds[1]);
    }
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    execvpe(child_argv[0], child_argv.data(), envp.data());
    _exit(127);
  }

  if (options.new_process_group) {
    (void)setpgid(pid, pid);
  }

  close_fd(stdin_pipe[0]);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  set_non_blocking(stdin_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  // A child that exits without reading stdin must not kill us with SIGPIPE.
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });

  ProcessResult result;
  std::size_t stdin_written = 0;
  if (options.stdin_data.empty()) {
    close_fd(stdin_pipe[1]);
  }

  int status = 0;
  bool exited = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    if (stdin_pipe[1] >= 0) {
      const ssize_t wrote = write(stdin_pipe[1], options.stdin_data.data() + stdin_written,
                                  options.stdin_data.size() - stdin_written);
      if (wrote > 0) {
        stdin_written += static_cast<std::size_t>(wrote);
      }
      if (stdin_written >= options.stdin_data.size() ||
          (wrote < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
        close_fd(stdin_pipe[1]);
      }
    }

    if (stdout_pipe[0] >= 0 &&
        !read_capped(stdout_pipe[0], result.stdout_text, options.max_stdout_bytes,
                     result.stdout_truncated)) {
      close_fd(stdout_pipe[0]);
    }
    if (stderr_pipe[0] >= 0 &&
        !read_capped(stderr_pipe[0], result.stderr_text, options.max_stderr_bytes,
                     result.stderr_truncated)) {
      close_fd(stderr_pipe[0]);
    }

    if (!exited) {
      const pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        exited = true;
      }
    }
    if (exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      if (options.new_process_group) {
        (void)kill(-pid, SIGKILL);
      }
      (void)kill(pid, SIGKILL);
      if (!exited) {
        (void)waitpid(pid, &status, 0);
        exited = true;
      }
      break;
    }

    // Grandchildren may keep the pipes open after the child exits; the timeout bounds that.
    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  if (stdout_pipe[0] >= 0) {
    (void)read_capped(stdout_pipe[0], result.stdout_text, options.max_stdout_bytes,
                      result.stdout_truncated);
  }
  if (stderr_pipe[0] >= 0) {
    (void)read_capped(stderr_pipe[0], result.stderr_text, options.max_stderr_bytes,
                      result.stderr_truncated);
  }
  close_fd(stdin_pipe[1]);
  close_fd(stdout_pipe[0]);
  close_fd(stderr_pipe[0]);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = -1;
  }
  if (result.timed_out) {
    result.exit_code = -1;
  }
  return Result<ProcessResult>::success(std::move(result));
}

} // namespace execbox::common
