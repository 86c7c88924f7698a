#include "test_framework.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/sandbox/archive.hpp"
#include "execbox/sandbox/sandbox.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace sb = execbox::sandbox;
using execbox::common::ErrorKind;
using execbox::testing::FakeArchiveTransport;
using execbox::testing::FakeDockerRunner;

struct Harness {
  std::shared_ptr<FakeDockerRunner> runner = std::make_shared<FakeDockerRunner>();
  std::shared_ptr<FakeArchiveTransport> transport = std::make_shared<FakeArchiveTransport>();
  std::unique_ptr<sb::ContainerSandbox> box;

  explicit Harness(execbox::config::SandboxConfig config = {}) {
    box = std::make_unique<sb::ContainerSandbox>(std::move(config), runner, transport);
  }

  void start() {
    const auto created = box->create();
    execbox::tests::require(created.ok(), "create failed: " + created.error());
  }
};

bool contains_sequence(const std::vector<std::string> &args,
                       const std::vector<std::string> &sequence) {
  return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

bool contains(const std::vector<std::string> &args, const std::string &item) {
  return std::find(args.begin(), args.end(), item) != args.end();
}

bool ran_command_starting(const FakeDockerRunner &runner, const std::string &prefix) {
  for (const auto &command : runner.commands()) {
    if (command.size() > 2 && command[0] == "exec" &&
        command.back().compare(0, prefix.size(), prefix) == 0) {
      return true;
    }
  }
  return false;
}

FakeDockerRunner::ExecHandler reply(int exit_code, std::string out, std::string err = "") {
  return [=](const std::string &, const std::string &) {
    sb::DockerProcessResult result;
    result.exit_code = exit_code;
    result.stdout_text = out;
    result.stderr_text = err;
    return execbox::common::Result<sb::DockerProcessResult>::success(result);
  };
}

} // namespace

void register_sandbox_tests(std::vector<execbox::tests::TestCase> &tests) {
  using execbox::tests::require;

  tests.push_back({"create_args_hardened_by_default", [] {
                     const execbox::config::SandboxConfig config;
                     const auto args = sb::build_container_create_args(config, "sandbox_abcd1234",
                                                                       "/tmp/host_dir");
                     require(args.front() == "create", "create subcommand");
                     require(contains_sequence(args, {"--name", "sandbox_abcd1234"}), "name");
                     require(contains_sequence(args, {"--label", "execbox.sandbox=1"}), "label");
                     require(contains_sequence(args, {"--workdir", "/workspace"}), "workdir");
                     require(contains_sequence(args, {"--memory", "128m"}), "memory");
                     require(contains_sequence(args, {"--cpu-period", "100000", "--cpu-quota",
                                                      "50000"}),
                             "cpu quota");
                     require(contains_sequence(args, {"--network", "none"}), "no network");
                     require(contains_sequence(args, {"--cap-drop", "ALL"}), "capabilities");
                     require(contains_sequence(args, {"--security-opt", "no-new-privileges"}),
                             "no new privileges");
                     require(contains_sequence(args, {"--user", "nobody"}), "user");
                     require(contains(args, "--read-only"), "read-only root");
                     require(contains_sequence(args, {"--tmpfs", "/tmp:size=10m"}), "tmpfs");
                     require(contains_sequence(args, {"-v", "/tmp/host_dir:/workspace:rw"}),
                             "workdir bind");
                     require(contains_sequence(args, {"python:3.11-alpine", "tail", "-f",
                                                      "/dev/null"}),
                             "image and keep-alive command last");
                     require(args.back() == "/dev/null", "ends with the command");
                   }});

  tests.push_back({"create_args_follow_config", [] {
                     execbox::config::SandboxConfig config;
                     config.network_enabled = true;
                     config.read_only_root = false;
                     config.cpu_share = 0;
                     config.user = "";
                     config.drop_capabilities = false;
                     config.extra_volumes = {"/data:/data:ro", " "};
                     const auto args = sb::build_container_create_args(config, "n", "/h");
                     require(contains_sequence(args, {"--network", "bridge"}), "bridge network");
                     require(!contains(args, "--read-only"), "writable root");
                     require(!contains(args, "--cpu-quota"), "no cpu limit");
                     require(!contains(args, "--user"), "image default user");
                     require(!contains(args, "--cap-drop"), "capabilities kept");
                     require(contains_sequence(args, {"-v", "/data:/data:ro"}), "extra volume");
                     require(std::count(args.begin(), args.end(), "-v") == 2, "blank bind skipped");
                   }});

  tests.push_back({"cpu_quota_scales_share", [] {
                     require(sb::cpu_quota_for_share(1.5) == 150000, "1.5 cores");
                     require(sb::cpu_quota_for_share(0.25) == 25000, "quarter core");
                   }});

  tests.push_back({"sandbox_create_and_cleanup", [] {
                     Harness h;
                     h.start();
                     require(h.box->state() == sb::SandboxState::Running, "running");
                     require(h.box->container_id() == "cid1", "id from create output");
                     require(h.box->container_name().rfind("sandbox_", 0) == 0 &&
                                 h.box->container_name().size() == 16,
                             "name: " + h.box->container_name());
                     const auto workdir = h.box->host_workdir();
                     require(std::filesystem::is_directory(workdir), "host workdir exists");
                     require(h.runner->count("start") == 1, "started");

                     const auto problems = h.box->cleanup();
                     require(problems.empty(), "clean cleanup");
                     require(h.box->state() == sb::SandboxState::Cleaned, "cleaned");
                     require(h.runner->live_containers().empty(), "container removed");
                     require(!std::filesystem::exists(workdir), "host workdir removed");

                     const auto before = h.runner->commands().size();
                     require(h.box->cleanup().empty(), "second cleanup is quiet");
                     require(h.runner->commands().size() == before, "second cleanup does nothing");
                   }});

  tests.push_back({"sandbox_create_twice_rejected", [] {
                     Harness h;
                     h.start();
                     const auto again = h.box->create();
                     require(!again.ok() && again.kind() == ErrorKind::Validation, "rejected");
                   }});

  tests.push_back({"sandbox_failed_start_releases_container", [] {
                     Harness h;
                     h.runner->fail_start = true;
                     const auto created = h.box->create();
                     require(!created.ok(), "create failed");
                     require(created.error().rfind("Failed to create sandbox: ", 0) == 0,
                             created.error());
                     require(h.box->state() == sb::SandboxState::Cleaned, "cleaned");
                     require(h.runner->live_containers().empty(), "created container removed");
                     require(h.runner->count("rm") == 1, "rm issued");
                     require(h.box->host_workdir().empty(), "host workdir released");
                   }});

  tests.push_back({"sandbox_failed_create_leaves_nothing", [] {
                     Harness h;
                     h.runner->fail_create = true;
                     const auto created = h.box->create();
                     require(!created.ok(), "create failed");
                     require(created.error().find("pull access denied") != std::string::npos,
                             created.error());
                     require(h.box->state() == sb::SandboxState::Cleaned, "cleaned");
                     require(h.runner->count("start") == 0, "never started");
                     require(h.runner->count("rm") == 0, "nothing to remove");
                   }});

  tests.push_back({"sandbox_rejects_traversal_before_transfer", [] {
                     execbox::testing::TempWorkspace workspace;
                     workspace.create_file("payload.txt", "x");
                     Harness h;
                     h.start();
                     const auto execs_before = h.runner->count("exec");

                     const auto written = h.box->write_file("../../etc/passwd", "root::0:0");
                     require(!written.ok() && written.kind() == ErrorKind::Security,
                             "write refused");
                     require(written.error().find("Path traversal detected") != std::string::npos,
                             written.error());
                     const auto read = h.box->read_file("/workspace/../etc/shadow");
                     require(!read.ok() && read.kind() == ErrorKind::Security, "read refused");
                     require(!h.box->copy_from("a/../../b", workspace.path()).ok(),
                             "copy_from refused");
                     require(!h.box->copy_to(workspace.path() / "payload.txt", "../x").ok(),
                             "copy_to refused");

                     require(h.transport->put_calls() == 0, "no archive uploaded");
                     require(h.transport->get_calls() == 0, "no archive fetched");
                     require(h.runner->count("exec") == execs_before, "no command ran");
                   }});

  tests.push_back({"sandbox_write_then_read", [] {
                     Harness h;
                     h.start();
                     const auto written = h.box->write_file("notes/a.txt", "hello\n");
                     require(written.ok(), "write: " + written.error());
                     require(h.transport->file("/workspace/notes/a.txt") == "hello\n",
                             "stored under the work dir");
                     require(ran_command_starting(*h.runner, "mkdir -p '/workspace/notes'"),
                             "parent directory created");

                     const auto read = h.box->read_file("/workspace/notes/a.txt");
                     require(read.ok() && read.value() == "hello\n", "read back");

                     const auto missing = h.box->read_file("nope.txt");
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "missing");
                   }});

  tests.push_back({"sandbox_file_ops_need_running_container", [] {
                     Harness h;
                     const auto written = h.box->write_file("a.txt", "x");
                     require(!written.ok() && written.kind() == ErrorKind::Runtime, "not running");
                     require(written.error() == "cannot write file: sandbox is uninitialized",
                             written.error());
                     require(!h.box->run_command("true").ok(), "no commands before create");
                   }});

  tests.push_back({"sandbox_copy_from_skips_unsafe_members", [] {
                     execbox::testing::ObserverCapture capture;
                     execbox::testing::TempWorkspace workspace;
                     const auto escaped = workspace.path().parent_path() / "evil.txt";
                     const auto tar = sb::pack_tar({
                         sb::ArchiveEntry{.name = "out", .type = sb::ArchiveEntryType::Directory},
                         sb::ArchiveEntry{.name = "out/good.txt", .data = "fine"},
                         sb::ArchiveEntry{.name = "../evil.txt", .data = "owned"},
                         sb::ArchiveEntry{.name = "out/../../evil.txt", .data = "owned"},
                     });
                     require(tar.ok(), "tar built");
                     Harness h;
                     h.start();
                     h.transport->set_raw_archive(tar.value());

                     const auto copied = h.box->copy_from("out", workspace.path());
                     require(copied.ok(), "copy: " + copied.error());
                     require(execbox::common::read_file(workspace.path() / "out" / "good.txt")
                                     .value() == "fine",
                             "safe member extracted");
                     require(!std::filesystem::exists(escaped), "nothing written outside");

                     std::size_t skipped = 0;
                     for (const auto &warning : capture.observer().warnings()) {
                       if (warning.find("evil.txt") != std::string::npos) {
                         ++skipped;
                       }
                     }
                     require(skipped == 2, "both unsafe members reported");
                   }});

  tests.push_back({"sandbox_copy_from_into_file", [] {
                     execbox::testing::TempWorkspace workspace;
                     Harness h;
                     h.start();
                     h.transport->set_file("/workspace/result.txt", "42");
                     const auto target = workspace.path() / "local.txt";
                     const auto copied = h.box->copy_from("result.txt", target);
                     require(copied.ok(), "copy: " + copied.error());
                     require(execbox::common::read_file(target).value() == "42", "contents");

                     const auto missing = h.box->copy_from("absent", workspace.path());
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "not found");
                   }});

  tests.push_back({"sandbox_host_workdir_is_private", [] {
                     namespace fs = std::filesystem;
                     Harness h;
                     h.start();
                     const auto mode = fs::status(h.box->host_workdir()).permissions();
                     const auto shared = fs::perms::group_read | fs::perms::group_write |
                                         fs::perms::others_read | fs::perms::others_write;
                     require((mode & shared) == fs::perms::none,
                             "workdir must not be listable or writable by other users");
                     require((mode & fs::perms::owner_all) == fs::perms::owner_all,
                             "owner keeps full access");
                   }});

  tests.push_back({"sandbox_copy_from_applies_member_modes", [] {
                     namespace fs = std::filesystem;
                     execbox::testing::TempWorkspace workspace;
                     const auto tar = sb::pack_tar({
                         sb::ArchiveEntry{.name = "run.sh", .data = "echo hi\n", .mode = 0750},
                     });
                     require(tar.ok(), "tar built");
                     Harness h;
                     h.start();
                     h.transport->set_raw_archive(tar.value());

                     const auto target = workspace.path() / "run.sh";
                     const auto copied = h.box->copy_from("run.sh", target);
                     require(copied.ok(), "copy: " + copied.error());
                     require(fs::status(target).permissions() ==
                                 (fs::perms::owner_all | fs::perms::group_read |
                                  fs::perms::group_exec),
                             "member mode applied to the host file");
                   }});

  tests.push_back({"sandbox_copy_to_uploads_tree", [] {
                     execbox::testing::TempWorkspace workspace;
                     workspace.create_file("job/main.py", "print(1)\n");
                     workspace.create_file("job/lib/util.py", "X = 1\n");
                     Harness h;
                     h.start();

                     const auto copied = h.box->copy_to(workspace.path() / "job", "/workspace/job");
                     require(copied.ok(), "copy: " + copied.error());
                     require(h.transport->file("/workspace/job/main.py") == "print(1)\n", "main.py");
                     require(h.transport->file("/workspace/job/lib/util.py") == "X = 1\n",
                             "nested file");
                     require(ran_command_starting(*h.runner, "test -e '/workspace/job'"),
                             "upload verified");

                     const auto absent = h.box->copy_to(workspace.path() / "missing", "m");
                     require(!absent.ok() && absent.kind() == ErrorKind::NotFound, "missing source");
                   }});

  tests.push_back({"sandbox_copy_to_reports_failed_verification", [] {
                     execbox::testing::TempWorkspace workspace;
                     workspace.create_file("data.txt", "d");
                     Harness h;
                     h.start();
                     h.runner->set_exec_handler([](const std::string &, const std::string &command) {
                       sb::DockerProcessResult result;
                       result.exit_code = command.rfind("test -e", 0) == 0 ? 1 : 0;
                       return execbox::common::Result<sb::DockerProcessResult>::success(result);
                     });
                     const auto copied = h.box->copy_to(workspace.path() / "data.txt", "data.txt");
                     require(!copied.ok(), "verification failed");
                     require(copied.error().find("Copy verification failed") != std::string::npos,
                             copied.error());
                   }});

  tests.push_back({"sandbox_run_command_output", [] {
                     Harness h;
                     h.start();
                     h.runner->set_exec_handler(reply(3, "partial\n", "boom\n"));
                     const auto ran = h.box->run_command("false");
                     require(ran.ok(), "non-zero exit is still output");
                     require(ran.value().exit_code == 3, "exit code");
                     require(ran.value().stdout_text == "partial\n", "stdout");
                     require(ran.value().stderr_text == "boom\n", "stderr");
                     require(h.box->state() == sb::SandboxState::Running, "still running");
                   }});

  tests.push_back({"sandbox_timeout_removes_container", [] {
                     Harness h;
                     h.start();
                     h.runner->set_exec_handler([](const std::string &, const std::string &) {
                       return execbox::common::Result<sb::DockerProcessResult>::failure(
                           ErrorKind::Timeout, "docker exec timed out");
                     });
                     const auto ran = h.box->run_command("sleep 100", std::chrono::seconds(2));
                     require(!ran.ok() && ran.kind() == ErrorKind::SandboxTimeout, "timeout kind");
                     require(ran.error() == "Command timed out after 2 seconds", ran.error());
                     require(h.box->state() == sb::SandboxState::Failed, "failed");
                     require(h.runner->live_containers().empty(), "container gone");
                     require(h.runner->count("kill") == 1, "killed");
                     require(h.box->cleanup().empty(), "cleanup after timeout is quiet");
                   }});

  tests.push_back({"sandbox_detects_stopped_container", [] {
                     Harness h;
                     h.start();
                     h.runner->set_exec_handler(
                         reply(1, "", "Error response from daemon: Container cid1 is not running\n"));
                     const auto ran = h.box->run_command("ls");
                     require(!ran.ok() && ran.kind() == ErrorKind::Runtime, "runtime error");
                     require(ran.error() == "Sandbox container is no longer running", ran.error());
                     require(h.box->state() == sb::SandboxState::Exited, "exited");
                   }});

  tests.push_back({"sandbox_cleanup_reports_remove_failure", [] {
                     Harness h;
                     h.start();
                     h.runner->fail_remove = true;
                     const auto problems = h.box->cleanup();
                     require(problems.size() == 1, "one problem");
                     require(problems.front().rfind("Container remove error: ", 0) == 0,
                             problems.front());
                     require(h.box->state() == sb::SandboxState::Cleaned, "still cleaned");
                   }});
}
