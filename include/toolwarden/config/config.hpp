#pragma once

#include "toolwarden/common/result.hpp"
#include "toolwarden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolwarden::config {

/// Resolution order: explicit override, TOOLWARDEN_CONFIG_PATH, ~/.toolwarden/config.toml.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Parse TOML text into a Config. Unknown keys are ignored here and reported by
/// validate_config's caller through `warnings`.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text,
                                                  std::vector<std::string> *warnings = nullptr);

/// Load from config_path(). A missing file yields defaults plus env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);

/// Applies TOOLWARDEN_SECURITY_* and TOOLWARDEN_OBSERVABILITY environment overrides.
void apply_env_overrides(Config &config);

/// Fails on settings that cannot work (bad sanitization mode, malformed webhook URL,
/// zero capacities). Returns warnings for settings that work but look wrong.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Accepts http:// and https:// URLs with a non-empty host.
[[nodiscard]] common::Status validate_webhook_url(const std::string &url);

} // namespace toolwarden::config
