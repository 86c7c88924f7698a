#pragma once

#include "execbox/security/denylist.hpp"
#include "execbox/tools/tool.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace execbox::executors {

class EmbeddedPython;

/// Runs Python source in-process with a restricted namespace.
///
/// Source is statically checked against a deny-set before anything runs. Execution happens
/// on a dedicated thread raced against the timeout; a thread still running at the deadline
/// is asked to stop and then detached, so a loop stuck in C code keeps its CPU until it
/// returns on its own.
class RestrictedExecutor {
public:
  explicit RestrictedExecutor(std::size_t max_output_chars = 10'000,
                              const security::DenyList &deny = security::python_denylist());
  RestrictedExecutor(EmbeddedPython &runtime, std::size_t max_output_chars,
                     const security::DenyList &deny = security::python_denylist());

  [[nodiscard]] bool available() const;

  [[nodiscard]] tools::ExecutionResult execute(const std::string &code,
                                               std::chrono::seconds timeout) const;

private:
  EmbeddedPython &runtime_;
  std::size_t max_output_chars_;
  security::DenyList deny_;
};

} // namespace execbox::executors
