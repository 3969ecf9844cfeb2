#include "pathfence/config/config.hpp"

#include "pathfence/common/fs.hpp"
#include "pathfence/common/toml.hpp"
#include "pathfence/observability/factory.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pathfence::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".pathfence";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *WORKSPACE_FOLDER = "workspace";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PATHFENCE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

common::Result<std::filesystem::path> workspace_dir() {
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / WORKSPACE_FOLDER);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> effective_workspace_dir(const Config &config) {
  const std::string configured = common::trim(config.sandbox.workspace_dir);
  if (configured.empty()) {
    return workspace_dir();
  }
  return common::Result<std::filesystem::path>::success(
      std::filesystem::path(common::expand_path(configured)));
}

void apply_env_overrides(Config &config) {
  if (const char *workspace = std::getenv("PATHFENCE_WORKSPACE");
      workspace != nullptr && *workspace) {
    config.sandbox.workspace_dir = workspace;
  }

  if (const char *backend = std::getenv("PATHFENCE_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;

  auto &sandbox = config.sandbox;
  sandbox.workspace_dir = doc.get_string("sandbox.workspace_dir", sandbox.workspace_dir);
  sandbox.suggest_external_access =
      doc.get_bool("sandbox.suggest_external_access", sandbox.suggest_external_access);
  sandbox.external_read_tool =
      doc.get_string("sandbox.external_read_tool", sandbox.external_read_tool);
  sandbox.external_list_tool =
      doc.get_string("sandbox.external_list_tool", sandbox.external_list_tool);
  sandbox.external_tool_prefix =
      doc.get_string("sandbox.external_tool_prefix", sandbox.external_tool_prefix);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[sandbox]\n";
  if (!config.sandbox.workspace_dir.empty()) {
    out << "workspace_dir = " << common::quote_toml_string(config.sandbox.workspace_dir) << "\n";
  }
  out << "suggest_external_access = " << bool_to_toml(config.sandbox.suggest_external_access)
      << "\n";
  out << "external_read_tool = " << common::quote_toml_string(config.sandbox.external_read_tool)
      << "\n";
  out << "external_list_tool = " << common::quote_toml_string(config.sandbox.external_list_tool)
      << "\n";
  out << "external_tool_prefix = "
      << common::quote_toml_string(config.sandbox.external_tool_prefix) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (const auto created = common::ensure_dir(path.parent_path()); !created.ok()) {
      return common::Status::error(created.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << render_config(config);

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!observability::is_known_backend(config.observability.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  if (config.sandbox.suggest_external_access &&
      (common::trim(config.sandbox.external_read_tool).empty() ||
       common::trim(config.sandbox.external_list_tool).empty())) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.external_read_tool and sandbox.external_list_tool must be set when "
        "sandbox.suggest_external_access is enabled");
  }

  const std::string configured = common::trim(config.sandbox.workspace_dir);
  if (!configured.empty() &&
      std::filesystem::path(common::expand_path(configured)).is_relative()) {
    warnings.push_back("sandbox.workspace_dir is relative and depends on the working directory");
  }

  const auto workspace = effective_workspace_dir(config);
  if (!workspace.ok()) {
    return common::Result<std::vector<std::string>>::failure(workspace.error());
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(workspace.value(), ec)) {
    warnings.push_back("workspace directory does not exist: " + workspace.value().string());
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace pathfence::config
