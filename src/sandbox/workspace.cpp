#include "pathfence/sandbox/workspace.hpp"

#include "pathfence/config/config.hpp"
#include "pathfence/observability/global.hpp"

#include <chrono>

namespace pathfence::sandbox {

ResolverOptions resolver_options_from_config(const config::SandboxConfig &config) {
  ResolverOptions options;
  options.suggest_external_access = config.suggest_external_access;
  options.external_read_tool = config.external_read_tool;
  options.external_list_tool = config.external_list_tool;
  options.external_tool_prefix = config.external_tool_prefix;
  return options;
}

WorkspaceSandbox::WorkspaceSandbox(std::filesystem::path workspace_root, ResolverOptions options)
    : workspace_root_(std::move(workspace_root)), options_(std::move(options)) {}

common::Result<WorkspaceSandbox> WorkspaceSandbox::from_config(const config::Config &config) {
  auto root = config::effective_workspace_dir(config);
  if (!root.ok()) {
    return common::Result<WorkspaceSandbox>::failure(root.error());
  }
  return common::Result<WorkspaceSandbox>::success(
      WorkspaceSandbox(std::move(root.value()), resolver_options_from_config(config.sandbox)));
}

ResolveResult WorkspaceSandbox::resolve(const std::string &user_path) const {
  const auto started = std::chrono::steady_clock::now();
  auto result = resolve_sandbox_path(user_path, workspace_root_, options_);
  observability::record_resolve_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));

  if (result.ok()) {
    observability::record_path_resolved(user_path, result.value());
  } else {
    const auto &rejection = result.error();
    observability::record_path_rejected(user_path, rejection_kind_name(rejection.kind),
                                        rejection.message);
    if (rejection.kind == RejectionKind::RootResolution) {
      observability::record_error("sandbox", rejection.message);
    }
  }
  return result;
}

bool WorkspaceSandbox::contains(const std::string &user_path) const {
  return resolve(user_path).ok();
}

} // namespace pathfence::sandbox
