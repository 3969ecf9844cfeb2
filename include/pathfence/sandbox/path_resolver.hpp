#pragma once

#include "pathfence/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace pathfence::sandbox {

enum class RejectionKind {
  TraversalDenied,
  RootResolution,
  ParentResolution,
  InvalidPath,
  AccessDenied,
  PathResolution,
};

/// Stable snake_case tag for logs and CLI output, e.g. "access_denied".
[[nodiscard]] std::string_view rejection_kind_name(RejectionKind kind);

struct Rejection {
  RejectionKind kind = RejectionKind::InvalidPath;
  std::string message;
};

/// Controls the guidance appended to access-denied messages. Callers that have no
/// out-of-workspace filesystem capability turn `suggest_external_access` off.
struct ResolverOptions {
  bool suggest_external_access = true;
  std::string external_read_tool = "mcp_filesystem_read_file";
  std::string external_list_tool = "mcp_filesystem_list_directory";
  std::string external_tool_prefix = "mcp_filesystem_";
};

using ResolveResult = common::Result<std::filesystem::path, Rejection>;

/// Resolves an untrusted path against `workspace_root`.
///
/// On success the returned path is canonical and its components start with the
/// canonical workspace root. Any `..` component is rejected before the filesystem is
/// consulted. A path whose final component does not exist yet resolves through its
/// parent directory, which must exist. The workspace root and the candidate are
/// re-canonicalized on every call; nothing is cached.
///
/// Only metadata reads are performed. The result is valid at resolution time; callers
/// must perform I/O on the returned path, never on `user_path`.
[[nodiscard]] ResolveResult resolve_sandbox_path(const std::string &user_path,
                                                 const std::filesystem::path &workspace_root,
                                                 const ResolverOptions &options = {});

[[nodiscard]] std::string access_denied_message(const std::string &user_path,
                                                const ResolverOptions &options);

} // namespace pathfence::sandbox
