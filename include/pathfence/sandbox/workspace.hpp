#pragma once

#include "pathfence/common/result.hpp"
#include "pathfence/config/schema.hpp"
#include "pathfence/sandbox/path_resolver.hpp"

#include <filesystem>
#include <string>

namespace pathfence::sandbox {

[[nodiscard]] ResolverOptions resolver_options_from_config(const config::SandboxConfig &config);

/// Binds a workspace root to the resolver and reports every outcome to the global
/// observer. Holds no per-path state; safe to share between threads.
class WorkspaceSandbox {
public:
  explicit WorkspaceSandbox(std::filesystem::path workspace_root, ResolverOptions options = {});

  [[nodiscard]] static common::Result<WorkspaceSandbox> from_config(const config::Config &config);

  [[nodiscard]] ResolveResult resolve(const std::string &user_path) const;
  [[nodiscard]] bool contains(const std::string &user_path) const;

  [[nodiscard]] const std::filesystem::path &workspace_root() const { return workspace_root_; }
  [[nodiscard]] const ResolverOptions &options() const { return options_; }

private:
  std::filesystem::path workspace_root_;
  ResolverOptions options_;
};

} // namespace pathfence::sandbox
