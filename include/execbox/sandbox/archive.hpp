#pragma once

#include "execbox/common/result.hpp"

#include <string>
#include <vector>

namespace execbox::sandbox {

enum class ArchiveEntryType { File, Directory, Other };

/// One tar member held in memory. `Other` covers links and devices, which are listed but
/// never extracted.
struct ArchiveEntry {
  std::string name;
  ArchiveEntryType type = ArchiveEntryType::File;
  std::string data;
  unsigned int mode = 0644;
};

/// Build a POSIX tar stream from `entries` in order.
[[nodiscard]] common::Result<std::string> pack_tar(const std::vector<ArchiveEntry> &entries);

/// Read every member of a tar stream. File members carry their contents.
[[nodiscard]] common::Result<std::vector<ArchiveEntry>> unpack_tar(const std::string &bytes);

} // namespace execbox::sandbox
