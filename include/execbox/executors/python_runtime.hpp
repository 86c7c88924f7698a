#pragma once

#include "execbox/common/text.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace execbox::executors {

/// Builtins visible to restricted code. Everything else, including `__import__`, is absent.
[[nodiscard]] const std::vector<std::string> &restricted_builtin_names();

/// Process-wide embedded CPython interpreter.
///
/// Initialized on first use and never finalized: a timed-out worker may still be running
/// inside it. Callers from any thread take the GIL per run.
class EmbeddedPython {
public:
  [[nodiscard]] static EmbeddedPython &instance();

  EmbeddedPython(const EmbeddedPython &) = delete;
  EmbeddedPython &operator=(const EmbeddedPython &) = delete;

  [[nodiscard]] bool available() const { return available_; }
  [[nodiscard]] const std::string &init_error() const { return init_error_; }
  [[nodiscard]] const std::string &version() const { return version_; }

  /// Execute `code` as a module body in a fresh namespace holding only the restricted
  /// builtins. `print` appends to `out`; an uncaught exception is written to `err` as
  /// `Execution error: <Type>: <message>`. The interpreter thread id is published to
  /// `thread_id` before the code starts and reset to 0 when it finishes.
  void run(const std::string &code, common::BoundedBuffer &out, common::BoundedBuffer &err,
           std::atomic<unsigned long> *thread_id = nullptr);

  /// Ask the interpreter to raise TimeoutError in the thread published by `run` at its
  /// next bytecode boundary. Code blocked in C never sees it. Blocks until the GIL is free.
  bool interrupt(const std::atomic<unsigned long> &thread_id);

private:
  EmbeddedPython();

  bool available_ = false;
  std::string init_error_;
  std::string version_;
};

} // namespace execbox::executors
