#pragma once

#include "rmm/common/result.hpp"
#include "rmm/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace rmm::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Parse TOML text into a Config. Unknown sections and keys are ignored.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Load config.toml (defaults when the file is missing), then apply RMM_* overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Range and enum checks; the returned Config has normalized (lower-case) enum fields.
[[nodiscard]] common::Result<Config> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace rmm::config
