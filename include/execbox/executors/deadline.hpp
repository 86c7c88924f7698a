#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <thread>

namespace execbox::executors {

/// Run `fn` on a dedicated thread and wait at most `deadline` for it.
///
/// On time the thread is joined and its value (or exception) returned. Past the deadline the
/// thread is detached and std::nullopt is returned: the work keeps running in the background,
/// so `fn` must own (or share) everything it touches.
template <typename T>
[[nodiscard]] std::optional<T> run_with_deadline(std::function<T()> fn,
                                                 const std::chrono::milliseconds deadline) {
  auto promise = std::make_shared<std::promise<T>>();
  auto future = promise->get_future();
  std::thread worker([promise, fn = std::move(fn)]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });

  if (future.wait_for(deadline) == std::future_status::ready) {
    worker.join();
    return future.get();
  }
  worker.detach();
  return std::nullopt;
}

} // namespace execbox::executors
