#include "test_framework.hpp"

#include "execbox/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

bool has_issue(const std::vector<std::string> &issues, const std::string &needle) {
  for (const auto &issue : issues) {
    if (issue.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<execbox::tests::TestCase> &tests) {
  using execbox::tests::require;
  namespace cfg = execbox::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     const cfg::Config config;
                     require(cfg::validate_config(config).empty(), "defaults validate cleanly");
                     require(config.execution.tool_timeout_seconds == 30, "tool timeout");
                     require(config.sandbox.image == "python:3.12-slim", "long-lived image");
                     require(config.sandbox.work_dir == "/workspace", "work dir");
                     require(!config.sandbox.network_enabled, "network off");
                   }});

  tests.push_back({"config_category_profiles", [] {
                     const cfg::Config config;
                     const auto &dev = config.profiles.for_category("development");
                     require(dev.image == "python:3.11-alpine" && dev.timeout_seconds == 60 &&
                                 dev.memory_limit == "256m" && dev.cpu_share == 1.0,
                             "development profile");
                     const auto &sys = config.profiles.for_category("system");
                     require(sys.image == "ubuntu:22.04" && sys.cpu_share == 0.5, "system profile");
                     const auto &analysis = config.profiles.for_category("analysis");
                     require(analysis.timeout_seconds == 120 && analysis.memory_limit == "512m",
                             "analysis profile");
                     const auto &other = config.profiles.for_category("unknown");
                     require(other.timeout_seconds == 30 && other.memory_limit == "128m",
                             "fallback profile");
                     require(dev.user == "nobody" && dev.read_only_root && dev.drop_capabilities &&
                                 dev.tmpfs_size == "10m",
                             "profiles carry hardening");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
[execution]
tool_timeout_seconds = 12
worker_threads = 8
observer = "none"

[code_execution]
max_output_chars = 500
python_command = "python3.12"

[sandbox]
image = "alpine:3.20"
network_enabled = true
volumes = ["/data:/data:ro"]

[sandbox.analysis]
memory_limit = "1g"
cpu_share = 2.0
)");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &config = parsed.value();
                     require(config.execution.tool_timeout_seconds == 12, "tool timeout parsed");
                     require(config.execution.worker_threads == 8, "workers parsed");
                     require(config.execution.observer == "none", "observer parsed");
                     require(config.code_execution.max_output_chars == 500, "output cap parsed");
                     require(config.code_execution.python_command == "python3.12", "python cmd");
                     require(config.sandbox.image == "alpine:3.20", "sandbox image");
                     require(config.sandbox.network_enabled, "network flag");
                     require(config.sandbox.extra_volumes.size() == 1, "volumes");
                     require(config.profiles.analysis.memory_limit == "1g", "analysis memory");
                     require(config.profiles.analysis.cpu_share == 2.0, "analysis cpu");
                     require(config.profiles.analysis.image == "python:3.11-slim",
                             "untouched keys keep built-in values");
                   }});

  tests.push_back({"config_validation_reports_each_problem", [] {
                     cfg::Config config;
                     config.execution.worker_threads = 0;
                     config.execution.observer = "statsd";
                     config.sandbox.cpu_share = 0.0;
                     config.sandbox.memory_limit = "lots";
                     config.profiles.system.timeout_seconds = 0;
                     config.profiles.analysis.work_dir = "relative";
                     const auto issues = cfg::validate_config(config);
                     require(has_issue(issues, "worker_threads"), "worker threads flagged");
                     require(has_issue(issues, "observer"), "observer flagged");
                     require(has_issue(issues, "sandbox.cpu_share"), "cpu share flagged");
                     require(has_issue(issues, "sandbox.memory_limit"), "memory flagged");
                     require(has_issue(issues, "sandbox.system.timeout_seconds"),
                             "profile timeout flagged");
                     require(has_issue(issues, "sandbox.analysis.work_dir"), "work dir flagged");
                   }});

  tests.push_back({"config_memory_limit_format", [] {
                     require(cfg::is_valid_memory_limit("512m"), "512m");
                     require(cfg::is_valid_memory_limit("2G"), "2G");
                     require(cfg::is_valid_memory_limit("1048576"), "plain bytes");
                     require(!cfg::is_valid_memory_limit("m"), "no digits");
                     require(!cfg::is_valid_memory_limit("12mb"), "two-letter suffix");
                     require(!cfg::is_valid_memory_limit(""), "empty");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     EnvGuard timeout("EXECBOX_TOOL_TIMEOUT", "7");
                     EnvGuard image("EXECBOX_SANDBOX_IMAGE", "busybox:latest");
                     EnvGuard observer("EXECBOX_OBSERVER", "none");
                     EnvGuard bad_socket("EXECBOX_DOCKER_SOCKET", std::nullopt);
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.execution.tool_timeout_seconds == 7, "timeout override");
                     require(config.sandbox.image == "busybox:latest", "image override");
                     require(config.execution.observer == "none", "observer override");
                     require(config.execution.docker_socket == "/var/run/docker.sock",
                             "unset variable leaves default");
                   }});

  tests.push_back({"config_load_missing_file_uses_defaults", [] {
                     execbox::testing::TempWorkspace workspace;
                     cfg::set_config_path_override(workspace.path() / "absent.toml");
                     const auto loaded = cfg::load_config();
                     cfg::set_config_path_override(std::nullopt);
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().profiles.system.image == "ubuntu:22.04",
                             "defaults returned");
                   }});

  tests.push_back({"config_load_from_override_path", [] {
                     execbox::testing::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[execution]\nworker_threads = 3\n");
                     cfg::set_config_path_override(workspace.path() / "config.toml");
                     const auto path = cfg::config_path();
                     const auto loaded = cfg::load_config();
                     cfg::set_config_path_override(std::nullopt);
                     require(path.ok() && path.value() == workspace.path() / "config.toml",
                             "override path reported");
                     require(loaded.ok() && loaded.value().execution.worker_threads == 3,
                             "file values applied");
                   }});

  tests.push_back({"config_malformed_toml_is_validation_error", [] {
                     const auto parsed = cfg::parse_config("[execution\nworker_threads = 3\n");
                     require(!parsed.ok(), "malformed section header rejected");
                     require(parsed.kind() == execbox::common::ErrorKind::Validation,
                             "validation kind");
                   }});
}
