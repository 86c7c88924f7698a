#include "execbox/common/fs.hpp"
#include "execbox/common/random.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace execbox::common {

namespace {

constexpr const char *kWhitespace = " \t\n\r\f\v";

bool is_env_char(const char ch, const bool first) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
         (!first && std::isdigit(static_cast<unsigned char>(ch)) != 0);
}

} // namespace

std::string trim(const std::string &input) {
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  return input.substr(first, input.find_last_not_of(kWhitespace) - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure("HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

// `~` at the front, then `$NAME` and `${NAME}`. Unset variables expand to nothing.
std::string expand_path(std::string value) {
  if (starts_with(value, "~")) {
    if (const auto home = home_dir(); home.ok()) {
      value = home.value().string() + value.substr(1);
    }
  }

  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;
  while (i < value.size()) {
    const bool braced = value.compare(i, 2, "${") == 0;
    const std::size_t name_start = i + (braced ? 2 : 1);
    if (value[i] != '$' || name_start >= value.size() ||
        !is_env_char(value[name_start], true)) {
      out.push_back(value[i++]);
      continue;
    }
    std::size_t name_end = name_start;
    while (name_end < value.size() && is_env_char(value[name_end], false)) {
      ++name_end;
    }
    if (braced && (name_end >= value.size() || value[name_end] != '}')) {
      out.push_back(value[i++]);
      continue;
    }
    if (const char *var = std::getenv(value.substr(name_start, name_end - name_start).c_str())) {
      out += var;
    }
    i = name_end + (braced ? 1 : 0);
  }
  return out;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  return std::mismatch(parent.begin(), parent.end(), candidate.begin(), candidate.end()).first ==
         parent.end();
}

Result<std::filesystem::path> make_temp_dir(const std::string &prefix) {
  std::error_code ec;
  const auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("No temp directory: " + ec.message());
  }

  for (int attempt = 0; attempt < 8; ++attempt) {
    const auto candidate = base / (prefix + random_hex(6));
    if (std::filesystem::create_directory(candidate, ec)) {
      return Result<std::filesystem::path>::success(candidate);
    }
    if (ec) {
      return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                    candidate.string() + ": " + ec.message());
    }
  }
  return Result<std::filesystem::path>::failure("Failed to allocate a unique temp directory");
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::NotFound,
                                        "Unable to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error("Unable to write file: " + path.string());
  }
  out << content;
  if (!out) {
    return Status::error("Short write: " + path.string());
  }
  return Status::success();
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() { (void)remove(); }

ScratchDirectory::ScratchDirectory(ScratchDirectory &&other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchDirectory &ScratchDirectory::operator=(ScratchDirectory &&other) noexcept {
  if (this != &other) {
    (void)remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

Result<ScratchDirectory> ScratchDirectory::create(const std::string &prefix) {
  auto dir = make_temp_dir(prefix);
  if (!dir.ok()) {
    return Result<ScratchDirectory>::failure(dir.error());
  }
  return Result<ScratchDirectory>::success(ScratchDirectory(dir.value()));
}

Status ScratchDirectory::remove() {
  if (path_.empty()) {
    return Status::success();
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  const auto removed = path_;
  path_.clear();
  if (ec) {
    return Status::error("Failed to remove " + removed.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace execbox::common
