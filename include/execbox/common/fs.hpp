#pragma once

#include "execbox/common/result.hpp"

#include <filesystem>
#include <string>

namespace execbox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Create a fresh directory under the system temp directory named `<prefix><random>`.
[[nodiscard]] Result<std::filesystem::path> make_temp_dir(const std::string &prefix);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

/// Owns a temp directory and removes it recursively on destruction.
class ScratchDirectory {
public:
  ScratchDirectory() = default;
  explicit ScratchDirectory(std::filesystem::path path);
  ~ScratchDirectory();

  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;
  ScratchDirectory(ScratchDirectory &&other) noexcept;
  ScratchDirectory &operator=(ScratchDirectory &&other) noexcept;

  [[nodiscard]] static Result<ScratchDirectory> create(const std::string &prefix);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] bool empty() const { return path_.empty(); }

  /// Remove the directory now; returns the removal error, if any.
  Status remove();

private:
  std::filesystem::path path_;
};

} // namespace execbox::common
