#pragma once

#include "execbox/common/worker_pool.hpp"
#include "execbox/config/schema.hpp"
#include "execbox/sandbox/docker.hpp"
#include "execbox/sandbox/engine_api.hpp"
#include "execbox/service/execution_registry.hpp"
#include "execbox/tools/tool_registry.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace execbox::service {

/// Per-call state. Created by execute(), dropped once the call is cleaned up.
struct ExecutionContext {
  std::shared_ptr<tools::ITool> tool;
  tools::ToolArgs parameters;
  tools::ExecutionMode mode = tools::ExecutionMode::Direct;
  config::SandboxConfig sandbox_config;
  std::string execution_id;
  std::chrono::steady_clock::time_point started;
  std::optional<std::string> container_id;
};

struct ActiveExecutionInfo {
  std::string execution_id;
  std::string container_id;
  std::string status;
  std::string created;
};

/// Routes tool calls to the direct, restricted or container tier and guarantees that every
/// container and scratch directory a call acquires is released before the call returns.
class ToolExecutorService {
public:
  struct Dependencies {
    std::shared_ptr<sandbox::IDockerRunner> runner;
    std::shared_ptr<sandbox::IArchiveTransport> transport;
  };

  ToolExecutorService(tools::ToolRegistry &registry, config::Config config,
                      Dependencies dependencies);
  ~ToolExecutorService();

  ToolExecutorService(const ToolExecutorService &) = delete;
  ToolExecutorService &operator=(const ToolExecutorService &) = delete;

  /// Never throws; every failure comes back as a failed result.
  [[nodiscard]] tools::ExecutionResult
  execute(const std::string &tool_name, const tools::ToolArgs &parameters,
          bool force_sandbox = false,
          const std::optional<config::SandboxConfig> &sandbox_config = std::nullopt);

  [[nodiscard]] std::future<tools::ExecutionResult>
  execute_async(std::string tool_name, tools::ToolArgs parameters, bool force_sandbox = false,
                std::optional<config::SandboxConfig> sandbox_config = std::nullopt);

  /// Registered containers that still exist, with their docker status.
  [[nodiscard]] std::vector<ActiveExecutionInfo> list_active_executions() const;

  /// Force-kill and remove the container of `execution_id`. False when the id is unknown.
  bool kill_execution(const std::string &execution_id);

  [[nodiscard]] bool runtime_available() const { return runtime_available_; }
  [[nodiscard]] const ExecutionRegistry &active_executions() const { return active_; }
  [[nodiscard]] const config::Config &config() const { return config_; }

  [[nodiscard]] static std::string generate_execution_id();

private:
  [[nodiscard]] tools::ExecutionResult execute_direct(ExecutionContext &ctx);
  [[nodiscard]] tools::ExecutionResult execute_restricted(ExecutionContext &ctx);
  [[nodiscard]] tools::ExecutionResult execute_sandboxed(ExecutionContext &ctx);
  [[nodiscard]] const config::SandboxConfig &default_sandbox_config(const tools::ITool &tool) const;
  bool remove_container(const std::string &container_id, const std::string &reason) const;
  void cleanup_execution(const std::string &execution_id);
  void publish_active_count() const;

  tools::ToolRegistry &registry_;
  config::Config config_;
  Dependencies dependencies_;
  bool runtime_available_ = false;
  ExecutionRegistry active_;
  std::unique_ptr<common::WorkerPool> pool_;
};

} // namespace execbox::service
