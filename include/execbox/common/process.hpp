#pragma once

#include "execbox/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace execbox::common {

struct ProcessOptions {
  std::filesystem::path working_dir;
  // Added to (or replacing entries of) the parent environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::chrono::milliseconds timeout{30'000};
  std::size_t max_stdout_bytes = 1024 * 1024;
  std::size_t max_stderr_bytes = 1024 * 1024;
  std::string stdin_data;
  // Child leads its own process group so a timeout can kill everything it spawned.
  bool new_process_group = true;
};

struct ProcessResult {
  int exit_code = -1;
  int term_signal = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

/// Fork/exec `argv` (PATH lookup on argv[0]) and collect its output. A timeout kills the
/// child (and its group) with SIGKILL and sets `timed_out`; it is not a failure Result.
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const ProcessOptions &options = {});

} // namespace execbox::common
