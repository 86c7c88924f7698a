#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::config {

/// Resource ceilings and hardening for one container sandbox.
struct SandboxConfig {
  std::string image = "python:3.11-alpine";
  std::uint32_t timeout_seconds = 30;
  std::string memory_limit = "128m";
  double cpu_share = 0.5;
  bool network_enabled = false;
  bool read_only_root = true;
  std::string tmpfs_size = "10m";
  std::size_t max_output_size = 10'000;
  std::string user = "nobody";
  bool drop_capabilities = true;
  bool no_new_privileges = true;
  std::string work_dir = "/workspace";
  // "host_path:container_path[:mode]"
  std::vector<std::string> extra_volumes;
};

struct SandboxProfiles {
  SandboxConfig fallback;
  SandboxConfig development{.image = "python:3.11-alpine",
                            .timeout_seconds = 60,
                            .memory_limit = "256m",
                            .cpu_share = 1.0};
  SandboxConfig system{.image = "ubuntu:22.04",
                       .timeout_seconds = 30,
                       .memory_limit = "128m",
                       .cpu_share = 0.5};
  SandboxConfig analysis{.image = "python:3.11-slim",
                         .timeout_seconds = 120,
                         .memory_limit = "512m",
                         .cpu_share = 1.5};

  /// Profile for a tool category name; unknown names get `fallback`.
  [[nodiscard]] const SandboxConfig &for_category(std::string_view category) const;
};

struct ExecutionConfig {
  std::uint32_t tool_timeout_seconds = 30;
  std::uint32_t worker_threads = 4;
  std::string observer = "log";
  std::string docker_socket = "/var/run/docker.sock";
  std::string docker_binary = "docker";
};

struct CodeExecutionConfig {
  std::uint32_t default_timeout_seconds = 30;
  std::size_t max_output_chars = 10'000;
  std::string python_command = "python3";
  std::string node_command = "node";
};

struct Config {
  ExecutionConfig execution;
  CodeExecutionConfig code_execution;
  // Long-lived sandbox used by `ContainerSandbox` when driven directly.
  SandboxConfig sandbox{.image = "python:3.12-slim",
                        .timeout_seconds = 300,
                        .memory_limit = "512m",
                        .cpu_share = 1.0,
                        .read_only_root = false,
                        .user = "",
                        .drop_capabilities = false,
                        .no_new_privileges = false};
  SandboxProfiles profiles;
};

} // namespace execbox::config
