#pragma once

#include "execbox/common/result.hpp"
#include "execbox/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace execbox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Returns every out-of-range value as a message; an empty list means the config is usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

[[nodiscard]] bool is_valid_memory_limit(const std::string &value);

void apply_env_overrides(Config &config);

} // namespace execbox::config
