#include "execbox/executors/restricted_executor.hpp"

#include "execbox/common/text.hpp"
#include "execbox/executors/deadline.hpp"
#include "execbox/executors/python_runtime.hpp"
#include "execbox/observability/global.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace execbox::executors {

namespace {

struct RunState {
  explicit RunState(const std::size_t cap) : out(cap), err(cap) {}

  common::BoundedBuffer out;
  common::BoundedBuffer err;
  std::atomic<unsigned long> thread_id{0};
};

} // namespace

RestrictedExecutor::RestrictedExecutor(const std::size_t max_output_chars,
                                       const security::DenyList &deny)
    : RestrictedExecutor(EmbeddedPython::instance(), max_output_chars, deny) {}

RestrictedExecutor::RestrictedExecutor(EmbeddedPython &runtime, const std::size_t max_output_chars,
                                       const security::DenyList &deny)
    : runtime_(runtime), max_output_chars_(max_output_chars), deny_(deny) {}

bool RestrictedExecutor::available() const { return runtime_.available(); }

tools::ExecutionResult RestrictedExecutor::execute(const std::string &code,
                                                   const std::chrono::seconds timeout) const {
  if (const auto violation = security::scan_python_source(code, deny_); violation.has_value()) {
    auto result = tools::ExecutionResult::failed(common::ErrorKind::Security, violation->message());
    result.metadata["language"] = deny_.language;
    result.metadata["security_violation"] = violation->symbol;
    return result;
  }

  if (!runtime_.available()) {
    auto result = tools::ExecutionResult::failed(
        common::ErrorKind::Runtime, "Python runtime unavailable: " + runtime_.init_error());
    result.metadata["language"] = deny_.language;
    return result;
  }

  // Shared with the worker, which may outlive this call.
  auto state = std::make_shared<RunState>(max_output_chars_);
  EmbeddedPython *runtime = &runtime_;
  const auto started = std::chrono::steady_clock::now();

  const auto finished = run_with_deadline<bool>(
      [state, runtime, code] {
        runtime->run(code, state->out, state->err, &state->thread_id);
        return true;
      },
      std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (!finished.has_value()) {
    // Delivering the interrupt needs the GIL, which the payload may hold inside one long C
    // call. The request is posted from its own thread so this call returns at the deadline.
    std::thread([state, runtime] { (void)runtime->interrupt(state->thread_id); }).detach();
    observability::record_warning("restricted_executor",
                                  "worker exceeded " + std::to_string(timeout.count()) +
                                      "s and was detached");
    auto result = tools::ExecutionResult::failed(
        common::ErrorKind::Timeout,
        "Code execution timed out after " + std::to_string(timeout.count()) + " seconds");
    result.metadata["language"] = deny_.language;
    result.metadata["timeout"] = std::to_string(timeout.count());
    result.metadata["restricted"] = "true";
    return result;
  }

  tools::ExecutionResult result;
  result.success = state->err.empty();
  result.truncated = state->out.truncated();
  result.result = state->out.render(common::OUTPUT_TRUNCATED_MARKER);
  if (!result.success) {
    result.error = state->err.render(common::ERROR_OUTPUT_TRUNCATED_MARKER);
    result.metadata["error_type"] = std::string(common::error_kind_to_string(common::ErrorKind::Runtime));
  }
  result.metadata["language"] = deny_.language;
  result.metadata["execution_time"] = common::seconds_text(elapsed);
  result.metadata["restricted"] = "true";
  result.metadata["output_length"] = std::to_string(result.result.size());
  return result;
}

} // namespace execbox::executors
