#pragma once

#include <string>

namespace pathfence::config {

struct SandboxConfig {
  // Empty means the default workspace under the config directory.
  std::string workspace_dir;
  bool suggest_external_access = true;
  std::string external_read_tool = "mcp_filesystem_read_file";
  std::string external_list_tool = "mcp_filesystem_list_directory";
  std::string external_tool_prefix = "mcp_filesystem_";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SandboxConfig sandbox;
  ObservabilityConfig observability;
};

} // namespace pathfence::config
