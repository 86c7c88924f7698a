#include "execbox/sandbox/archive.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <memory>

namespace execbox::sandbox {

namespace {

struct ArchiveWriteDeleter {
  void operator()(struct archive *a) const { archive_write_free(a); }
};
struct ArchiveReadDeleter {
  void operator()(struct archive *a) const { archive_read_free(a); }
};
struct EntryDeleter {
  void operator()(struct archive_entry *e) const { archive_entry_free(e); }
};

la_ssize_t append_to_string(struct archive *, void *client_data, const void *buffer,
                            const size_t length) {
  auto *out = static_cast<std::string *>(client_data);
  out->append(static_cast<const char *>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

std::string archive_error(struct archive *a, const std::string &what) {
  const char *detail = archive_error_string(a);
  return what + (detail != nullptr ? std::string(": ") + detail : std::string());
}

} // namespace

common::Result<std::string> pack_tar(const std::vector<ArchiveEntry> &entries) {
  std::unique_ptr<struct archive, ArchiveWriteDeleter> writer(archive_write_new());
  if (!writer) {
    return common::Result<std::string>::failure("archive_write_new failed");
  }

  std::string out;
  if (archive_write_set_format_pax_restricted(writer.get()) != ARCHIVE_OK ||
      archive_write_open(writer.get(), &out, nullptr, append_to_string, nullptr) != ARCHIVE_OK) {
    return common::Result<std::string>::failure(archive_error(writer.get(), "tar open failed"));
  }

  for (const auto &item : entries) {
    if (item.type == ArchiveEntryType::Other) {
      continue;
    }
    std::unique_ptr<struct archive_entry, EntryDeleter> entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), item.name.c_str());
    if (item.type == ArchiveEntryType::Directory) {
      archive_entry_set_filetype(entry.get(), AE_IFDIR);
      archive_entry_set_perm(entry.get(), item.mode == 0644 ? 0755 : item.mode);
      archive_entry_set_size(entry.get(), 0);
    } else {
      archive_entry_set_filetype(entry.get(), AE_IFREG);
      archive_entry_set_perm(entry.get(), item.mode);
      archive_entry_set_size(entry.get(), static_cast<la_int64_t>(item.data.size()));
    }
    if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
      return common::Result<std::string>::failure(
          archive_error(writer.get(), "tar header failed for " + item.name));
    }
    if (item.type == ArchiveEntryType::File && !item.data.empty() &&
        archive_write_data(writer.get(), item.data.data(), item.data.size()) < 0) {
      return common::Result<std::string>::failure(
          archive_error(writer.get(), "tar write failed for " + item.name));
    }
  }

  if (archive_write_close(writer.get()) != ARCHIVE_OK) {
    return common::Result<std::string>::failure(archive_error(writer.get(), "tar close failed"));
  }
  return common::Result<std::string>::success(std::move(out));
}

common::Result<std::vector<ArchiveEntry>> unpack_tar(const std::string &bytes) {
  std::unique_ptr<struct archive, ArchiveReadDeleter> reader(archive_read_new());
  if (!reader) {
    return common::Result<std::vector<ArchiveEntry>>::failure("archive_read_new failed");
  }
  archive_read_support_format_tar(reader.get());
  if (archive_read_open_memory(reader.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
    return common::Result<std::vector<ArchiveEntry>>::failure(
        archive_error(reader.get(), "tar open failed"));
  }

  std::vector<ArchiveEntry> entries;
  for (;;) {
    struct archive_entry *header = nullptr;
    const int r = archive_read_next_header(reader.get(), &header);
    if (r == ARCHIVE_EOF) {
      break;
    }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      return common::Result<std::vector<ArchiveEntry>>::failure(
          archive_error(reader.get(), "tar header read failed"));
    }

    ArchiveEntry entry;
    const char *pathname = archive_entry_pathname(header);
    entry.name = pathname != nullptr ? pathname : "";
    entry.mode = static_cast<unsigned int>(archive_entry_perm(header));
    switch (archive_entry_filetype(header)) {
    case AE_IFREG:
      entry.type = ArchiveEntryType::File;
      break;
    case AE_IFDIR:
      entry.type = ArchiveEntryType::Directory;
      break;
    default:
      entry.type = ArchiveEntryType::Other;
      break;
    }

    if (entry.type == ArchiveEntryType::File) {
      std::array<char, 1 << 16> buffer{};
      for (;;) {
        const la_ssize_t n = archive_read_data(reader.get(), buffer.data(), buffer.size());
        if (n == 0) {
          break;
        }
        if (n < 0) {
          return common::Result<std::vector<ArchiveEntry>>::failure(
              archive_error(reader.get(), "tar data read failed for " + entry.name));
        }
        entry.data.append(buffer.data(), static_cast<std::size_t>(n));
      }
    }
    entries.push_back(std::move(entry));
  }
  return common::Result<std::vector<ArchiveEntry>>::success(std::move(entries));
}

} // namespace execbox::sandbox
