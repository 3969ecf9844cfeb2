#pragma once

#include "pathfence/common/result.hpp"
#include "pathfence/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace pathfence::config {

/// Directory holding config.toml. Only save_config creates it.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
/// Default workspace root, `<config dir>/workspace`. Not created here.
[[nodiscard]] common::Result<std::filesystem::path> workspace_dir();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Workspace root the config selects: `sandbox.workspace_dir` (expanded) or the default.
[[nodiscard]] common::Result<std::filesystem::path> effective_workspace_dir(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace pathfence::config
