#include "pathfence/sandbox/path_resolver.hpp"

#include "pathfence/common/fs.hpp"

namespace pathfence::sandbox {

namespace {

constexpr int MAX_LINK_HOPS = 40;

ResolveResult reject(RejectionKind kind, std::string message) {
  return ResolveResult::failure(Rejection{.kind = kind, .message = std::move(message)});
}

bool has_parent_reference(const std::string &user_path) {
  for (const auto &segment : common::split_path_segments(user_path)) {
    if (segment == "..") {
      return true;
    }
  }
  // Catches forms the separator split misses, such as "C:.." on Windows.
  for (const auto &component : std::filesystem::path(user_path)) {
    if (component == "..") {
      return true;
    }
  }
  return false;
}

// Drops trailing "dir/" and "dir/." forms so filename() names the last real component.
std::filesystem::path strip_trailing_markers(std::filesystem::path path) {
  while (path.has_relative_path() && (!path.has_filename() || path.filename() == ".")) {
    path = path.parent_path();
  }
  return path;
}

// Follows a symlink chain whose final target does not exist yet.
common::Result<std::filesystem::path> follow_dangling_link(std::filesystem::path link) {
  for (int hop = 0; hop < MAX_LINK_HOPS; ++hop) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(link, ec);
    if (!std::filesystem::is_symlink(status)) {
      auto resolved = std::filesystem::weakly_canonical(link, ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(ec.message());
      }
      return common::Result<std::filesystem::path>::success(std::move(resolved));
    }

    const auto target = std::filesystem::read_symlink(link, ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure(ec.message());
    }
    link = target.is_absolute() ? target : link.parent_path() / target;
  }
  return common::Result<std::filesystem::path>::failure("too many levels of symbolic links");
}

ResolveResult canonicalize_new_entry(const std::filesystem::path &candidate) {
  const auto target = strip_trailing_markers(candidate);
  const auto parent = target.parent_path();
  if (parent.empty() || parent == target) {
    return reject(RejectionKind::InvalidPath, "Invalid path: no parent directory");
  }
  const auto filename = target.filename();
  if (filename.empty() || filename == "." || filename == "..") {
    return reject(RejectionKind::InvalidPath, "Invalid path: no filename");
  }

  std::error_code ec;
  const auto canonical_parent = std::filesystem::canonical(parent, ec);
  if (ec) {
    return reject(RejectionKind::ParentResolution,
                  "Failed to resolve parent directory: " + ec.message());
  }
  if (!std::filesystem::is_directory(canonical_parent, ec)) {
    return reject(RejectionKind::ParentResolution, "Failed to resolve parent directory: " +
                                                       canonical_parent.string() +
                                                       " is not a directory");
  }
  return ResolveResult::success(canonical_parent / filename);
}

} // namespace

std::string_view rejection_kind_name(const RejectionKind kind) {
  switch (kind) {
  case RejectionKind::TraversalDenied:
    return "traversal_denied";
  case RejectionKind::RootResolution:
    return "root_resolution";
  case RejectionKind::ParentResolution:
    return "parent_resolution";
  case RejectionKind::InvalidPath:
    return "invalid_path";
  case RejectionKind::AccessDenied:
    return "access_denied";
  case RejectionKind::PathResolution:
    return "path_resolution";
  }
  return "unknown";
}

std::string access_denied_message(const std::string &user_path, const ResolverOptions &options) {
  std::string message = "Access denied: path '" + user_path + "' resolves outside workspace.";
  if (options.suggest_external_access) {
    message += " If you have an external filesystem server configured, use the " +
               options.external_tool_prefix + "* tools (e.g. " + options.external_read_tool +
               ", " + options.external_list_tool + ") to access files outside the workspace.";
  }
  return message;
}

ResolveResult resolve_sandbox_path(const std::string &user_path,
                                   const std::filesystem::path &workspace_root,
                                   const ResolverOptions &options) {
  if (user_path.find('\0') != std::string::npos) {
    return reject(RejectionKind::InvalidPath, "Invalid path: contains null byte");
  }

  if (has_parent_reference(user_path)) {
    return reject(RejectionKind::TraversalDenied,
                  "Path traversal denied: '..' components are forbidden");
  }

  const std::filesystem::path requested(user_path);
  const std::filesystem::path candidate =
      requested.is_absolute() ? requested : workspace_root / requested;

  std::error_code ec;
  const auto canonical_root = std::filesystem::canonical(workspace_root, ec);
  if (ec) {
    return reject(RejectionKind::RootResolution,
                  "Failed to resolve workspace root: " + ec.message());
  }
  if (!std::filesystem::is_directory(canonical_root, ec)) {
    return reject(RejectionKind::RootResolution,
                  "Failed to resolve workspace root: " + canonical_root.string() +
                      " is not a directory");
  }

  std::filesystem::path canonical_candidate;
  // An error here (EACCES on a parent, for instance) is treated as "absent"; the parent
  // lookup below then reports it.
  std::error_code exists_ec;
  if (std::filesystem::exists(candidate, exists_ec)) {
    canonical_candidate = std::filesystem::canonical(candidate, ec);
    if (ec) {
      return reject(RejectionKind::PathResolution, "Failed to resolve path: " + ec.message());
    }
  } else if (std::error_code link_ec;
             std::filesystem::is_symlink(std::filesystem::symlink_status(candidate, link_ec))) {
    auto followed = follow_dangling_link(candidate);
    if (!followed.ok()) {
      return reject(RejectionKind::PathResolution, "Failed to resolve path: " + followed.error());
    }
    canonical_candidate = std::move(followed.value());
  } else {
    auto created = canonicalize_new_entry(candidate);
    if (!created.ok()) {
      return created;
    }
    canonical_candidate = std::move(created.value());
  }

  if (!common::is_subpath(canonical_candidate, canonical_root)) {
    return reject(RejectionKind::AccessDenied, access_denied_message(user_path, options));
  }

  return ResolveResult::success(std::move(canonical_candidate));
}

} // namespace pathfence::sandbox
