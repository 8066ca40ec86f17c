#pragma once

#include "drover/common/result.hpp"
#include "drover/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drover::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();

/// `--config` override, then DROVER_CONFIG_PATH, then ~/.drover/config.toml.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);

/// Loads the config file (defaults when it does not exist) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// TOML rendering of the effective configuration. The API key is masked.
[[nodiscard]] std::string render_config(const Config &config);

} // namespace drover::config
