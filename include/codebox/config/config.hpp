#pragma once

#include "codebox/common/result.hpp"
#include "codebox/common/toml.hpp"
#include "codebox/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codebox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the config file (defaults when it does not exist) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Builds a config from already-parsed TOML; used by load_config and tests.
[[nodiscard]] common::Result<Config> config_from_toml(const common::TomlDocument &doc);

/// Returns warnings, or a failure for values the server cannot start with.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace codebox::config
