#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace execbox::common {

inline constexpr const char *OUTPUT_TRUNCATED_MARKER = "\n... (output truncated)";
inline constexpr const char *ERROR_OUTPUT_TRUNCATED_MARKER = "\n... (error output truncated)";

/// Length of the longest prefix of `text` no longer than `max_bytes` that does not split
/// a UTF-8 sequence.
[[nodiscard]] std::size_t utf8_safe_prefix(const std::string &text, std::size_t max_bytes);

/// Cut `text` to `max_chars` bytes and append `marker` when anything was dropped.
[[nodiscard]] std::string truncate_output(const std::string &text, std::size_t max_chars,
                                          const std::string &marker, bool *truncated = nullptr);

/// Elapsed time in seconds with millisecond precision, e.g. "0.042".
[[nodiscard]] std::string seconds_text(std::chrono::steady_clock::duration elapsed);

/// Single-quote `value` for a POSIX shell command line.
[[nodiscard]] std::string shell_quote(const std::string &value);

/// Append-only text sink with a byte cap. Writes past the cap are dropped and remembered.
class BoundedBuffer {
public:
  explicit BoundedBuffer(std::size_t limit) : limit_(limit) {}

  void append(const std::string &chunk);
  [[nodiscard]] std::string str() const;
  [[nodiscard]] bool truncated() const;
  [[nodiscard]] bool empty() const;

  /// Contents followed by `marker` when the cap was hit.
  [[nodiscard]] std::string render(const std::string &marker) const;

private:
  std::size_t limit_;
  mutable std::mutex mutex_;
  std::string data_;
  bool truncated_ = false;
};

} // namespace execbox::common
