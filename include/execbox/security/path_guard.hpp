#pragma once

#include "execbox/common/result.hpp"

#include <filesystem>
#include <string>

namespace execbox::security {

/// Resolve `path` for use inside a container whose working directory is `work_dir`.
/// Relative paths are joined onto `work_dir`; absolute paths are kept. Any `..` segment,
/// in either spelling, is rejected with a Security error. The result is a normalized
/// absolute POSIX path.
[[nodiscard]] common::Result<std::string> resolve_container_path(const std::string &work_dir,
                                                                 const std::string &path);

/// Host destination for an archive member extracted under `root`, or a Security error when
/// the member name is absolute, contains `..`, or otherwise resolves outside `root`.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_extraction_target(const std::filesystem::path &root, const std::string &member_name);

} // namespace execbox::security
