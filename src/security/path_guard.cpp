#include "execbox/security/path_guard.hpp"

#include "execbox/common/fs.hpp"

#include <vector>

namespace execbox::security {

namespace {

std::vector<std::string> split_segments(const std::string &path) {
  std::vector<std::string> parts;
  std::string current;
  for (const char ch : path) {
    if (ch == '/') {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(current);
  return parts;
}

bool has_parent_segment(const std::string &path) {
  for (const auto &part : split_segments(path)) {
    if (part == "..") {
      return true;
    }
  }
  return false;
}

std::string join_normalized(const std::vector<std::string> &parts) {
  std::string out;
  for (const auto &part : parts) {
    if (part.empty() || part == ".") {
      continue;
    }
    out += "/" + part;
  }
  return out.empty() ? "/" : out;
}

} // namespace

common::Result<std::string> resolve_container_path(const std::string &work_dir,
                                                   const std::string &path) {
  if (path.find('\0') != std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorKind::Security,
                                                "Path contains null byte");
  }
  if (has_parent_segment(path) || has_parent_segment(work_dir)) {
    return common::Result<std::string>::failure(common::ErrorKind::Security,
                                                "Path traversal detected: " + path);
  }

  std::vector<std::string> parts;
  if (path.empty() || path.front() != '/') {
    parts = split_segments(work_dir);
  }
  for (auto &part : split_segments(path)) {
    parts.push_back(std::move(part));
  }
  return common::Result<std::string>::success(join_normalized(parts));
}

common::Result<std::filesystem::path>
resolve_extraction_target(const std::filesystem::path &root, const std::string &member_name) {
  if (member_name.empty() || member_name.front() == '/' || has_parent_segment(member_name)) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorKind::Security, "Unsafe archive member: " + member_name);
  }

  auto base = root.lexically_normal();
  if (base.has_parent_path() && base.filename().empty()) {
    base = base.parent_path();
  }
  const auto target = (base / member_name).lexically_normal();
  if (!common::is_subpath(target, base)) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorKind::Security, "Archive member escapes destination: " + member_name);
  }
  return common::Result<std::filesystem::path>::success(target);
}

} // namespace execbox::security
