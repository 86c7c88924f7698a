#include "execbox/config/config.hpp"

#include "execbox/common/fs.hpp"
#include "execbox/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>

namespace execbox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".execbox";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("EXECBOX_CONFIG"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const std::int64_t value = doc.get_int(key, fallback);
  return static_cast<std::uint32_t>(std::clamp<std::int64_t>(value, 0, UINT32_MAX));
}

void load_sandbox_config(SandboxConfig &out, const common::TomlDocument &doc,
                         const std::string &section) {
  const std::string p = section + ".";
  out.image = doc.get_string(p + "image", out.image);
  out.timeout_seconds = get_u32(doc, p + "timeout_seconds", out.timeout_seconds);
  out.memory_limit = doc.get_string(p + "memory_limit", out.memory_limit);
  out.cpu_share = doc.get_double(p + "cpu_share", out.cpu_share);
  out.network_enabled = doc.get_bool(p + "network_enabled", out.network_enabled);
  out.read_only_root = doc.get_bool(p + "read_only_root", out.read_only_root);
  out.tmpfs_size = doc.get_string(p + "tmpfs_size", out.tmpfs_size);
  out.max_output_size = get_u32(doc, p + "max_output_size",
                                static_cast<std::uint32_t>(out.max_output_size));
  out.user = doc.get_string(p + "user", out.user);
  out.drop_capabilities = doc.get_bool(p + "drop_capabilities", out.drop_capabilities);
  out.no_new_privileges = doc.get_bool(p + "no_new_privileges", out.no_new_privileges);
  out.work_dir = doc.get_string(p + "work_dir", out.work_dir);
  out.extra_volumes = doc.get_string_array(p + "volumes", out.extra_volumes);
}

void validate_sandbox(const SandboxConfig &sandbox, const std::string &section,
                      std::vector<std::string> &issues) {
  if (sandbox.image.empty()) {
    issues.push_back(section + ".image must not be empty");
  }
  if (sandbox.timeout_seconds == 0) {
    issues.push_back(section + ".timeout_seconds must be positive");
  }
  if (sandbox.cpu_share <= 0.0) {
    issues.push_back(section + ".cpu_share must be greater than 0");
  }
  if (!is_valid_memory_limit(sandbox.memory_limit)) {
    issues.push_back(section + ".memory_limit is malformed: " + sandbox.memory_limit);
  }
  if (!sandbox.tmpfs_size.empty() && !is_valid_memory_limit(sandbox.tmpfs_size)) {
    issues.push_back(section + ".tmpfs_size is malformed: " + sandbox.tmpfs_size);
  }
  if (sandbox.max_output_size == 0) {
    issues.push_back(section + ".max_output_size must be positive");
  }
  if (sandbox.work_dir.empty() || sandbox.work_dir.front() != '/') {
    issues.push_back(section + ".work_dir must be an absolute path");
  }
}

} // namespace

const SandboxConfig &SandboxProfiles::for_category(const std::string_view category) const {
  if (category == "development") {
    return development;
  }
  if (category == "system") {
    return system;
  }
  if (category == "analysis") {
    return analysis;
  }
  return fallback;
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *timeout = std::getenv("EXECBOX_TOOL_TIMEOUT"); timeout != nullptr && *timeout) {
    const std::string raw = common::trim(timeout);
    std::uint32_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.execution.tool_timeout_seconds = parsed;
    }
  }
  if (const char *socket = std::getenv("EXECBOX_DOCKER_SOCKET"); socket != nullptr && *socket) {
    config.execution.docker_socket = socket;
  }
  if (const char *image = std::getenv("EXECBOX_SANDBOX_IMAGE"); image != nullptr && *image) {
    config.sandbox.image = image;
  }
  if (const char *observer = std::getenv("EXECBOX_OBSERVER"); observer != nullptr && *observer) {
    config.execution.observer = observer;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Validation, parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &execution = config.execution;
  execution.tool_timeout_seconds =
      get_u32(doc, "execution.tool_timeout_seconds", execution.tool_timeout_seconds);
  execution.worker_threads = get_u32(doc, "execution.worker_threads", execution.worker_threads);
  execution.observer = doc.get_string("execution.observer", execution.observer);
  execution.docker_socket =
      common::expand_path(doc.get_string("execution.docker_socket", execution.docker_socket));
  execution.docker_binary = doc.get_string("execution.docker_binary", execution.docker_binary);

  auto &code = config.code_execution;
  code.default_timeout_seconds =
      get_u32(doc, "code_execution.default_timeout_seconds", code.default_timeout_seconds);
  code.max_output_chars = get_u32(doc, "code_execution.max_output_chars",
                                  static_cast<std::uint32_t>(code.max_output_chars));
  code.python_command = doc.get_string("code_execution.python_command", code.python_command);
  code.node_command = doc.get_string("code_execution.node_command", code.node_command);

  load_sandbox_config(config.sandbox, doc, "sandbox");
  load_sandbox_config(config.profiles.fallback, doc, "sandbox.default");
  load_sandbox_config(config.profiles.development, doc, "sandbox.development");
  load_sandbox_config(config.profiles.system, doc, "sandbox.system");
  load_sandbox_config(config.profiles.analysis, doc, "sandbox.analysis");

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Validation,
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

bool is_valid_memory_limit(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  std::size_t digits = 0;
  while (digits < value.size() && value[digits] >= '0' && value[digits] <= '9') {
    ++digits;
  }
  if (digits == 0) {
    return false;
  }
  const std::string suffix = common::to_lower(value.substr(digits));
  return suffix.empty() || suffix == "b" || suffix == "k" || suffix == "m" || suffix == "g";
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> issues;

  if (config.execution.tool_timeout_seconds == 0) {
    issues.emplace_back("execution.tool_timeout_seconds must be positive");
  }
  if (config.execution.worker_threads == 0) {
    issues.emplace_back("execution.worker_threads must be at least 1");
  }
  const std::string observer = common::to_lower(config.execution.observer);
  if (observer != "log" && observer != "none" && observer != "noop") {
    issues.push_back("execution.observer is unknown: " + config.execution.observer);
  }
  if (config.execution.docker_binary.empty()) {
    issues.emplace_back("execution.docker_binary must not be empty");
  }
  if (config.code_execution.default_timeout_seconds == 0) {
    issues.emplace_back("code_execution.default_timeout_seconds must be positive");
  }
  if (config.code_execution.max_output_chars == 0) {
    issues.emplace_back("code_execution.max_output_chars must be positive");
  }

  validate_sandbox(config.sandbox, "sandbox", issues);
  validate_sandbox(config.profiles.fallback, "sandbox.default", issues);
  validate_sandbox(config.profiles.development, "sandbox.development", issues);
  validate_sandbox(config.profiles.system, "sandbox.system", issues);
  validate_sandbox(config.profiles.analysis, "sandbox.analysis", issues);

  return issues;
}

} // namespace execbox::config
