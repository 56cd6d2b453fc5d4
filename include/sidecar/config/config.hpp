#pragma once

#include "sidecar/common/result.hpp"
#include "sidecar/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::config {

/// $SIDECAR_CONFIG_DIR, ~/.config/sidecar, or the directory of an overridden config path.
/// The directory is created when missing.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads .env files, reads the TOML file when present and applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Fails on settings that cannot work; returns warnings for ones that merely look wrong.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace sidecar::config
