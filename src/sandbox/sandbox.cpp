#include "execbox/sandbox/sandbox.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/common/random.hpp"
#include "execbox/common/text.hpp"
#include "execbox/observability/global.hpp"
#include "execbox/sandbox/archive.hpp"
#include "execbox/security/path_guard.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstring>
#include <utility>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace execbox::sandbox {

namespace {

constexpr long CPU_PERIOD_US = 100'000;
constexpr auto CREATE_TIMEOUT = std::chrono::minutes(5);
constexpr auto LIFECYCLE_TIMEOUT = std::chrono::seconds(30);

std::string parent_of(const std::string &container_path) {
  const auto slash = container_path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) {
    return "/";
  }
  return container_path.substr(0, slash);
}

std::string basename_of(const std::string &container_path) {
  const auto slash = container_path.find_last_of('/');
  return slash == std::string::npos ? container_path : container_path.substr(slash + 1);
}

std::string workdir_label(const std::string &work_dir) {
  std::string label = basename_of(work_dir);
  for (char &ch : label) {
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_' && ch != '-') {
      ch = '_';
    }
  }
  return label.empty() ? "root" : label;
}

common::Status write_host_file(const std::filesystem::path &target, const std::string &data,
                               const unsigned int mode) {
  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    return common::Status::error("Failed to create " + target.parent_path().string() + ": " +
                                 ec.message());
  }
  if (auto written = common::write_file(target, data); !written.ok()) {
    return written;
  }
  std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 0777),
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return common::Status::error("Failed to set mode on " + target.string() + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

// `user` is `name`, `uid` or `uid:gid`, as passed to `docker create --user`.
common::Result<std::pair<uid_t, gid_t>> lookup_container_owner(const std::string &user) {
  using Owner = std::pair<uid_t, gid_t>;
  const auto colon = user.find(':');
  const std::string name = user.substr(0, colon);
  const auto parse_id = [](const std::string &text, unsigned long &out) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return !text.empty() && ec == std::errc() && ptr == text.data() + text.size();
  };

  unsigned long uid = 0;
  if (parse_id(name, uid)) {
    unsigned long gid = uid;
    if (colon != std::string::npos && !parse_id(user.substr(colon + 1), gid)) {
      return common::Result<Owner>::failure("unsupported group in user '" + user + "'");
    }
    return common::Result<Owner>::success(
        Owner{static_cast<uid_t>(uid), static_cast<gid_t>(gid)});
  }

  passwd entry{};
  passwd *found = nullptr;
  std::vector<char> buffer(16384);
  if (::getpwnam_r(name.c_str(), &entry, buffer.data(), buffer.size(), &found) != 0 ||
      found == nullptr) {
    return common::Result<Owner>::failure("unknown host user '" + name + "'");
  }
  return common::Result<Owner>::success(Owner{found->pw_uid, found->pw_gid});
}

// The bind-mounted directory is never group- or world-writable. With privileges it is handed
// to the container user and kept at 0700; otherwise it stays ours at 0711 so an unprivileged
// container user can only reach the paths the daemon extracts into it.
common::Status restrict_host_workdir(const std::filesystem::path &dir, const std::string &user) {
  namespace fs = std::filesystem;
  fs::perms mode = fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
  if (!user.empty() && ::geteuid() == 0) {
    auto owner = lookup_container_owner(user);
    if (!owner.ok()) {
      return common::Status::error(owner.error());
    }
    if (::chown(dir.c_str(), owner.value().first, owner.value().second) != 0) {
      return common::Status::error("Failed to chown " + dir.string() + ": " +
                                   std::strerror(errno));
    }
    mode = fs::perms::owner_all;
  }
  std::error_code ec;
  fs::permissions(dir, mode, fs::perm_options::replace, ec);
  if (ec) {
    return common::Status::error("Failed to set mode on " + dir.string() + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace

std::string_view sandbox_state_to_string(const SandboxState state) {
  switch (state) {
  case SandboxState::Uninitialized:
    return "uninitialized";
  case SandboxState::Creating:
    return "creating";
  case SandboxState::Running:
    return "running";
  case SandboxState::Exited:
    return "exited";
  case SandboxState::Failed:
    return "failed";
  case SandboxState::Cleaned:
    return "cleaned";
  }
  return "uninitialized";
}

long cpu_quota_for_share(const double cpu_share) {
  return static_cast<long>(std::llround(cpu_share * static_cast<double>(CPU_PERIOD_US)));
}

std::vector<std::string> build_container_create_args(const config::SandboxConfig &config,
                                                     const std::string &name,
                                                     const std::filesystem::path &host_workdir) {
  std::vector<std::string> args = {"create", "--name", name, "--hostname", "sandbox"};
  args.push_back("--label");
  args.push_back("execbox.sandbox=1");
  args.push_back("--workdir");
  args.push_back(config.work_dir);

  if (!common::trim(config.memory_limit).empty()) {
    args.push_back("--memory");
    args.push_back(config.memory_limit);
  }
  if (config.cpu_share > 0) {
    args.push_back("--cpu-period");
    args.push_back(std::to_string(CPU_PERIOD_US));
    args.push_back("--cpu-quota");
    args.push_back(std::to_string(cpu_quota_for_share(config.cpu_share)));
  }

  args.push_back("--network");
  args.push_back(config.network_enabled ? "bridge" : "none");

  if (config.drop_capabilities) {
    args.push_back("--cap-drop");
    args.push_back("ALL");
  }
  if (config.no_new_privileges) {
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");
  }
  if (!common::trim(config.user).empty()) {
    args.push_back("--user");
    args.push_back(config.user);
  }
  if (config.read_only_root) {
    args.push_back("--read-only");
  }
  if (!common::trim(config.tmpfs_size).empty()) {
    args.push_back("--tmpfs");
    args.push_back("/tmp:size=" + config.tmpfs_size);
  }

  args.push_back("-v");
  args.push_back(host_workdir.string() + ":" + config.work_dir + ":rw");
  for (const auto &bind : config.extra_volumes) {
    if (common::trim(bind).empty()) {
      continue;
    }
    args.push_back("-v");
    args.push_back(bind);
  }

  args.push_back("--env");
  args.push_back("PYTHONUNBUFFERED=1");

  args.push_back(config.image);
  args.push_back("tail");
  args.push_back("-f");
  args.push_back("/dev/null");
  return args;
}

ContainerSandbox::ContainerSandbox(config::SandboxConfig config,
                                   std::shared_ptr<IDockerRunner> runner,
                                   std::shared_ptr<IArchiveTransport> transport)
    : config_(std::move(config)), runner_(std::move(runner)), transport_(std::move(transport)) {}

ContainerSandbox::~ContainerSandbox() {
  for (const auto &problem : cleanup()) {
    observability::record_warning("sandbox", problem);
  }
}

common::Status ContainerSandbox::create() {
  if (state_ != SandboxState::Uninitialized) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "sandbox already " +
                                     std::string(sandbox_state_to_string(state_)));
  }
  if (!runner_) {
    return common::Status::error("docker runner unavailable");
  }
  state_ = SandboxState::Creating;

  const auto fail = [this](const std::string &why) {
    const auto problems = cleanup();
    for (const auto &problem : problems) {
      observability::record_warning("sandbox", problem);
    }
    observability::record_sandbox(container_name_, "create", false, why);
    return common::Status::error(common::ErrorKind::Runtime, "Failed to create sandbox: " + why);
  };

  auto workdir = common::make_temp_dir("sandbox_" + workdir_label(config_.work_dir) + "_");
  if (!workdir.ok()) {
    return fail(workdir.error());
  }
  host_workdir_ = workdir.value();
  if (auto restricted = restrict_host_workdir(host_workdir_, config_.user); !restricted.ok()) {
    return fail(restricted.error());
  }

  container_name_ = "sandbox_" + common::random_hex(4);
  auto created = runner_->run(build_container_create_args(config_, container_name_, host_workdir_),
                              DockerCommandOptions{.timeout = CREATE_TIMEOUT});
  if (!created.ok()) {
    return fail(created.error());
  }
  container_id_ = common::trim(created.value().stdout_text);
  if (container_id_.empty()) {
    container_id_ = container_name_;
  }

  auto started = runner_->run({"start", container_id_},
                              DockerCommandOptions{.timeout = LIFECYCLE_TIMEOUT});
  if (!started.ok()) {
    return fail(started.error());
  }

  auto channel = std::make_unique<DockerExecChannel>(runner_, container_id_, config_.work_dir);
  if (auto opened = channel->open(); !opened.ok()) {
    return fail(opened.error());
  }
  channel_ = std::move(channel);

  state_ = SandboxState::Running;
  observability::record_sandbox(container_name_, "create", true, config_.image);
  return common::Status::success();
}

common::Status ContainerSandbox::require_running(const std::string_view operation) const {
  if (state_ != SandboxState::Running || !channel_) {
    return common::Status::error(common::ErrorKind::Runtime,
                                 "cannot " + std::string(operation) + ": sandbox is " +
                                     std::string(sandbox_state_to_string(state_)));
  }
  return common::Status::success();
}

void ContainerSandbox::force_remove(const std::string &reason) {
  if (channel_) {
    (void)channel_->close();
    channel_.reset();
  }
  if (!container_id_.empty() && runner_) {
    auto killed = runner_->run({"kill", container_id_},
                               DockerCommandOptions{.allow_failure = true,
                                                    .timeout = LIFECYCLE_TIMEOUT});
    observability::record_sandbox(container_name_, "kill", killed.ok(), reason);
    auto removed = runner_->run({"rm", "-f", container_id_},
                                DockerCommandOptions{.allow_failure = true,
                                                     .timeout = LIFECYCLE_TIMEOUT});
    observability::record_sandbox(container_name_, "remove", removed.ok(),
                                  removed.ok() ? reason : removed.error());
    if (removed.ok() && (removed.value().exit_code == 0 ||
                         is_missing_container_error(removed.value().stderr_text))) {
      container_id_.clear();
    }
  }
  state_ = SandboxState::Failed;
}

common::Result<CommandOutput> ContainerSandbox::run_command(
    const std::string &command, const std::optional<std::chrono::seconds> timeout) {
  if (auto running = require_running("run command"); !running.ok()) {
    return common::Result<CommandOutput>::failure(running.kind(), running.error());
  }

  const auto limit = timeout.value_or(std::chrono::seconds(config_.timeout_seconds));
  auto ran = channel_->run(command, limit);
  if (!ran.ok()) {
    if (ran.kind() == common::ErrorKind::Timeout) {
      force_remove("command timeout");
      return common::Result<CommandOutput>::failure(
          common::ErrorKind::SandboxTimeout,
          "Command timed out after " + std::to_string(limit.count()) + " seconds");
    }
    return ran;
  }

  const auto &stderr_text = ran.value().stderr_text;
  if (ran.value().exit_code != 0 &&
      (stderr_text.find("is not running") != std::string::npos ||
       is_missing_container_error(stderr_text))) {
    state_ = SandboxState::Exited;
    if (channel_) {
      (void)channel_->close();
      channel_.reset();
    }
    return common::Result<CommandOutput>::failure(common::ErrorKind::Runtime,
                                                  "Sandbox container is no longer running");
  }
  return ran;
}

common::Status ContainerSandbox::ensure_directory(const std::string &directory) {
  auto made = run_command("mkdir -p " + common::shell_quote(directory));
  if (!made.ok()) {
    return common::Status::error(made.kind(), made.error());
  }
  if (made.value().exit_code != 0) {
    return common::Status::error("Failed to create directory " + directory + ": " +
                                 common::trim(made.value().stderr_text));
  }
  return common::Status::success();
}

common::Result<std::string> ContainerSandbox::read_file(const std::string &path) {
  auto resolved = security::resolve_container_path(config_.work_dir, path);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(), resolved.error());
  }
  if (auto running = require_running("read file"); !running.ok()) {
    return common::Result<std::string>::failure(running.kind(), running.error());
  }

  auto tar = transport_->get_archive(container_id_, resolved.value());
  if (!tar.ok()) {
    return common::Result<std::string>::failure(tar.kind(), tar.error());
  }
  auto entries = unpack_tar(tar.value());
  if (!entries.ok()) {
    return common::Result<std::string>::failure(entries.error());
  }
  for (auto &entry : entries.value()) {
    if (entry.type == ArchiveEntryType::File) {
      return common::Result<std::string>::success(std::move(entry.data));
    }
  }
  return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                              "Not a regular file: " + resolved.value());
}

common::Status ContainerSandbox::write_file(const std::string &path, const std::string &content) {
  auto resolved = security::resolve_container_path(config_.work_dir, path);
  if (!resolved.ok()) {
    return common::Status::error(resolved.kind(), resolved.error());
  }
  if (auto running = require_running("write file"); !running.ok()) {
    return running;
  }

  const std::string directory = parent_of(resolved.value());
  const std::string name = basename_of(resolved.value());
  if (name.empty()) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "Not a file path: " + resolved.value());
  }
  if (auto made = ensure_directory(directory); !made.ok()) {
    return made;
  }

  auto tar = pack_tar({ArchiveEntry{.name = name, .type = ArchiveEntryType::File, .data = content}});
  if (!tar.ok()) {
    return common::Status::error(tar.error());
  }
  return transport_->put_archive(container_id_, directory, tar.value());
}

common::Status ContainerSandbox::copy_from(const std::string &container_path,
                                           const std::filesystem::path &host_path) {
  auto resolved = security::resolve_container_path(config_.work_dir, container_path);
  if (!resolved.ok()) {
    return common::Status::error(resolved.kind(), resolved.error());
  }
  if (auto running = require_running("copy from container"); !running.ok()) {
    return running;
  }

  auto tar = transport_->get_archive(container_id_, resolved.value());
  if (!tar.ok()) {
    return common::Status::error(tar.kind(), tar.error());
  }
  auto unpacked = unpack_tar(tar.value());
  if (!unpacked.ok()) {
    return common::Status::error(unpacked.error());
  }
  const auto &entries = unpacked.value();
  if (entries.empty()) {
    return common::Status::error(common::ErrorKind::NotFound,
                                 "Nothing to copy at " + resolved.value());
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(host_path, ec)) {
    // Destination names a file: the archive must hold exactly that one file.
    if (entries.size() != 1 || entries.front().type != ArchiveEntryType::File) {
      return common::Status::error(common::ErrorKind::Validation,
                                   "Copying into a file requires a single-file source: " +
                                       resolved.value());
    }
    return write_host_file(host_path, entries.front().data, entries.front().mode);
  }

  for (const auto &entry : entries) {
    if (entry.type == ArchiveEntryType::Other) {
      observability::record_warning("sandbox", "skipped non-regular archive member " + entry.name);
      continue;
    }
    auto target = security::resolve_extraction_target(host_path, entry.name);
    if (!target.ok()) {
      observability::record_warning("sandbox", target.error());
      continue;
    }
    if (entry.type == ArchiveEntryType::Directory) {
      std::filesystem::create_directories(target.value(), ec);
      if (ec) {
        return common::Status::error("Failed to create " + target.value().string() + ": " +
                                     ec.message());
      }
      continue;
    }
    if (auto written = write_host_file(target.value(), entry.data, entry.mode); !written.ok()) {
      return written;
    }
  }
  return common::Status::success();
}

common::Status ContainerSandbox::copy_to(const std::filesystem::path &host_path,
                                         const std::string &container_path) {
  auto resolved = security::resolve_container_path(config_.work_dir, container_path);
  if (!resolved.ok()) {
    return common::Status::error(resolved.kind(), resolved.error());
  }
  if (auto running = require_running("copy to container"); !running.ok()) {
    return running;
  }

  std::error_code ec;
  if (!std::filesystem::exists(host_path, ec)) {
    return common::Status::error(common::ErrorKind::NotFound,
                                 "Source not found: " + host_path.string());
  }

  const std::string root_name = basename_of(resolved.value());
  if (root_name.empty()) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "Destination must name a file or directory: " + resolved.value());
  }

  std::vector<ArchiveEntry> entries;
  if (std::filesystem::is_directory(host_path, ec)) {
    entries.push_back(ArchiveEntry{.name = root_name, .type = ArchiveEntryType::Directory,
                                   .mode = 0755});
    for (auto it = std::filesystem::recursive_directory_iterator(host_path, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      const auto relative = it->path().lexically_relative(host_path).generic_string();
      const auto status = it->symlink_status(ec);
      if (std::filesystem::is_directory(status)) {
        entries.push_back(ArchiveEntry{.name = root_name + "/" + relative,
                                       .type = ArchiveEntryType::Directory,
                                       .mode = 0755});
      } else if (std::filesystem::is_regular_file(status)) {
        auto data = common::read_file(it->path());
        if (!data.ok()) {
          return common::Status::error(data.kind(), data.error());
        }
        entries.push_back(ArchiveEntry{.name = root_name + "/" + relative,
                                       .type = ArchiveEntryType::File,
                                       .data = std::move(data.value()),
                                       .mode = 0644});
      }
    }
    if (ec) {
      return common::Status::error("Failed to walk " + host_path.string() + ": " + ec.message());
    }
  } else {
    auto data = common::read_file(host_path);
    if (!data.ok()) {
      return common::Status::error(data.kind(), data.error());
    }
    entries.push_back(ArchiveEntry{.name = root_name,
                                   .type = ArchiveEntryType::File,
                                   .data = std::move(data.value())});
  }

  const std::string directory = parent_of(resolved.value());
  if (auto made = ensure_directory(directory); !made.ok()) {
    return made;
  }
  auto tar = pack_tar(entries);
  if (!tar.ok()) {
    return common::Status::error(tar.error());
  }
  if (auto put = transport_->put_archive(container_id_, directory, tar.value()); !put.ok()) {
    return put;
  }

  auto check = run_command("test -e " + common::shell_quote(resolved.value()));
  if (!check.ok()) {
    return common::Status::error(check.kind(), check.error());
  }
  if (check.value().exit_code != 0) {
    return common::Status::error("Copy verification failed: " + resolved.value() +
                                 " missing after upload");
  }
  return common::Status::success();
}

std::vector<std::string> ContainerSandbox::cleanup() {
  std::vector<std::string> errors;
  if (state_ == SandboxState::Cleaned) {
    return errors;
  }

  if (channel_) {
    if (auto closed = channel_->close(); !closed.ok()) {
      errors.push_back("Terminal cleanup error: " + closed.error());
    }
    channel_.reset();
  }

  if (!container_id_.empty() && runner_) {
    auto stopped = runner_->run({"stop", "-t", "5", container_id_},
                                DockerCommandOptions{.allow_failure = true,
                                                     .timeout = LIFECYCLE_TIMEOUT});
    if (!stopped.ok()) {
      errors.push_back("Container stop error: " + stopped.error());
    } else if (stopped.value().exit_code != 0 &&
               !is_missing_container_error(stopped.value().stderr_text)) {
      errors.push_back("Container stop error: " + common::trim(stopped.value().stderr_text));
    }

    auto removed = runner_->run({"rm", "-f", container_id_},
                                DockerCommandOptions{.allow_failure = true,
                                                     .timeout = LIFECYCLE_TIMEOUT});
    if (!removed.ok()) {
      errors.push_back("Container remove error: " + removed.error());
    } else if (removed.value().exit_code != 0 &&
               !is_missing_container_error(removed.value().stderr_text)) {
      errors.push_back("Container remove error: " + common::trim(removed.value().stderr_text));
    }
    observability::record_sandbox(container_name_, "remove", errors.empty());
  }
  container_id_.clear();

  if (!host_workdir_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(host_workdir_, ec);
    if (ec) {
      errors.push_back("Host workdir cleanup error: " + ec.message());
    }
    host_workdir_.clear();
  }

  state_ = SandboxState::Cleaned;
  observability::record_sandbox(container_name_, "cleanup", errors.empty(),
                                errors.empty() ? "" : std::to_string(errors.size()) + " error(s)");
  return errors;
}

} // namespace execbox::sandbox
